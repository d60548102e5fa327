#pragma once
#include <vector>
#include <string>
#include <filesystem>

#include <fmt/core.h>
#include <fmt/color.h>

namespace fs = std::filesystem;

std::vector<double> get_QBER_range(double QBER_begin, double QBER_end, double QBER_step);
fs::path get_results_file_path(const fs::path &directory, size_t trials_number, size_t key_length, size_t seed);

// Prints at most max_length elements, followed by "..." when the array is longer.
template <typename T>
void print_array(const std::vector<T> &array, size_t max_length)
{
    for (size_t i = 0; i < array.size() && i < max_length; i++)
    {
        fmt::print(fg(fmt::color::blue), "{} ", array[i]);
    }
    if (array.size() > max_length)
    {
        fmt::print(fg(fmt::color::blue), "...");
    }
    fmt::print("\n");
}
