#include "bit_array_operations.hpp"

#include <numeric>
#include <algorithm>
#include <stdexcept>

// Generates Alice's key
std::vector<int> generate_random_bit_array(std::mt19937 &prng, size_t length)
{
    std::uniform_int_distribution<int> distribution(0, 1);
    std::vector<int> random_bit_array(length);
    for (size_t i = 0; i < length; ++i)
    {
        random_bit_array[i] = distribution(prng);
    }
    return random_bit_array;
}

// Generates Bob's key by flipping exactly floor(length * error_probability) bits of Alice's key at random positions.
// Returns the rate that was actually injected.
double introduce_errors(std::mt19937 &prng, const std::vector<int> &bit_array, double error_probability,
                        std::vector<int> &bit_array_with_errors_out)
{
    if (error_probability < 0. || error_probability > 1.)
    {
        throw std::invalid_argument("Error probability must be in [0, 1].");
    }

    size_t array_length = bit_array.size();
    size_t num_errors = static_cast<size_t>(array_length * error_probability);
    bit_array_with_errors_out = bit_array;
    if (num_errors == 0)
    {
        return 0.;
    }

    std::vector<size_t> error_positions(array_length);
    std::iota(error_positions.begin(), error_positions.end(), 0);
    std::shuffle(error_positions.begin(), error_positions.end(), prng);
    for (size_t i = 0; i < num_errors; ++i)
    {
        bit_array_with_errors_out[error_positions[i]] ^= 1;
    }
    return static_cast<double>(num_errors) / array_length;
}

// XOR of the bits at permutation[begin], ..., permutation[end - 1].
int calculate_parity(const std::vector<int> &bit_array, const std::vector<size_t> &permutation, size_t begin, size_t end)
{
    int parity = 0;
    for (size_t i = begin; i < end; i++)
    {
        parity ^= bit_array[permutation[i]];
    }
    return parity;
}

size_t count_mismatches(const std::vector<int> &bit_array1, const std::vector<int> &bit_array2)
{
    if (bit_array1.size() != bit_array2.size())
    {
        throw std::invalid_argument("Bit arrays have different lengths.");
    }

    size_t mismatches = 0;
    for (size_t i = 0; i < bit_array1.size(); i++)
    {
        mismatches += static_cast<size_t>(bit_array1[i] ^ bit_array2[i]);
    }
    return mismatches;
}

bool arrays_equal(const std::vector<int> &bit_array1, const std::vector<int> &bit_array2)
{
    if (bit_array1.size() != bit_array2.size())
    {
        return false;
    }
    for (size_t i = 0; i < bit_array1.size(); i++)
    {
        if (bit_array1[i] != bit_array2[i])
        {
            return false;
        }
    }
    return true;
}

// Erases the given positions from the array, keeping the order of the remaining bits.
void remove_positions(std::vector<int> &bit_array, std::vector<size_t> positions)
{
    std::sort(positions.begin(), positions.end());
    positions.erase(std::unique(positions.begin(), positions.end()), positions.end());
    if (!positions.empty() && positions.back() >= bit_array.size())
    {
        throw std::out_of_range("Position to remove is outside of the bit array.");
    }

    size_t write_pos = 0;
    size_t next_removed = 0;
    for (size_t read_pos = 0; read_pos < bit_array.size(); read_pos++)
    {
        if (next_removed < positions.size() && positions[next_removed] == read_pos)
        {
            next_removed++;
            continue;
        }
        bit_array[write_pos++] = bit_array[read_pos];
    }
    bit_array.resize(write_pos);
}

std::vector<size_t> make_permutation(size_t length, std::mt19937 &prng)
{
    std::vector<size_t> permutation(length);
    std::iota(permutation.begin(), permutation.end(), 0);
    std::shuffle(permutation.begin(), permutation.end(), prng);
    return permutation;
}

// Both parties call this with the same arguments and get the same generator.
std::mt19937 make_prng(size_t seed, prng_stream stream, size_t index)
{
    std::seed_seq seq{static_cast<unsigned>(seed & 0xFFFFFFFFu), static_cast<unsigned>((seed >> 16) >> 16),
                      static_cast<unsigned>(stream), static_cast<unsigned>(index & 0xFFFFFFFFu)};
    return std::mt19937(seq);
}
