#pragma once
#include <random>
#include <vector>
#include <cstddef>
#include <algorithm>

std::vector<int> generate_random_bit_array(std::mt19937 &prng, size_t length);
double introduce_errors(std::mt19937 &prng, const std::vector<int> &bit_array, double error_probability,
                        std::vector<int> &bit_array_with_errors_out);
int calculate_parity(const std::vector<int> &bit_array, const std::vector<size_t> &permutation, size_t begin, size_t end);
size_t count_mismatches(const std::vector<int> &bit_array1, const std::vector<int> &bit_array2);
bool arrays_equal(const std::vector<int> &bit_array1, const std::vector<int> &bit_array2);
void remove_positions(std::vector<int> &bit_array, std::vector<size_t> positions);
std::vector<size_t> make_permutation(size_t length, std::mt19937 &prng);

// Independent random streams derived from one session seed.
enum class prng_stream : unsigned
{
    SAMPLING = 1,
    PERMUTATION = 2,
    HASH_SELECTION = 3
};

std::mt19937 make_prng(size_t seed, prng_stream stream, size_t index = 0);
