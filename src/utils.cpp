#include "utils.hpp"

#include <stdexcept>

// Values from QBER_begin to QBER_end inclusive. A small tolerance keeps the end value despite accumulated rounding.
std::vector<double> get_QBER_range(double QBER_begin, double QBER_end, double QBER_step)
{
    std::vector<double> QBER;
    if (QBER_step <= 0.)
    {
        throw std::runtime_error("QBER step must be > 0.");
    }
    for (size_t i = 0;; i++)
    {
        double value = QBER_begin + i * QBER_step;
        if (value > QBER_end + QBER_step * 1e-6)
        {
            break;
        }
        QBER.push_back(value);
    }
    if (QBER.empty())
    {
        throw std::runtime_error("An error occurred when generating a QBER range.");
    }
    return QBER;
}

fs::path get_results_file_path(const fs::path &directory, size_t trials_number, size_t key_length, size_t seed)
{
    std::string filename = "cascade(trial_num=" + std::to_string(trials_number) + ",key_length=" + std::to_string(key_length) +
                           ",seed=" + std::to_string(seed) + ").csv";
    return directory / filename;
}
