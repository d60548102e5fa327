#include "privacy_amplification.hpp"
#include "qkd_error.hpp"
#include "bit_array_operations.hpp"

#include <cstdint>
#include <stdexcept>

size_t privacy_amplification_length(size_t key_length, size_t leakage, size_t security_parameter, size_t residual_error_margin)
{
    long long target_length = static_cast<long long>(key_length) - static_cast<long long>(leakage) -
                              static_cast<long long>(security_parameter) - static_cast<long long>(residual_error_margin);
    if (target_length <= 0)
    {
        throw qkd_failure(failure_reason::INSUFFICIENT_KEY_MATERIAL,
                          "Key of " + std::to_string(key_length) + " bits minus leakage " + std::to_string(leakage) +
                              ", security parameter " + std::to_string(security_parameter) + " and residual margin " +
                              std::to_string(residual_error_margin) + " leaves " + std::to_string(target_length) + " bits.");
    }
    return static_cast<size_t>(target_length);
}

size_t select_hash_seed(size_t prng_seed)
{
    std::mt19937 prng = make_prng(prng_seed, prng_stream::HASH_SELECTION);
    uint64_t high = prng();
    uint64_t low = prng();
    return static_cast<size_t>((high << 32) | low);
}

// Fills `length` bits from the generator, 32 at a time.
static std::vector<int> draw_bits(std::mt19937 &prng, size_t length)
{
    std::vector<int> bits(length);
    uint32_t word = 0;
    for (size_t i = 0; i < length; i++)
    {
        if (i % 32 == 0)
        {
            word = prng();
        }
        bits[i] = static_cast<int>((word >> (i % 32)) & 1u);
    }
    return bits;
}

std::vector<int> toeplitz_hash(const std::vector<int> &key, size_t output_length, size_t seed, BS::thread_pool &pool)
{
    size_t key_length = key.size();
    if (key_length == 0 || output_length == 0 || output_length > key_length)
    {
        throw std::invalid_argument("Hash output length must be in [1, key length].");
    }

    std::mt19937 prng = make_prng(seed, prng_stream::HASH_SELECTION);
    // T[i][j] = diagonal[i - j + key_length - 1]
    std::vector<int> diagonal = draw_bits(prng, key_length + output_length - 1);

    std::vector<int> hashed(output_length);
    pool.detach_loop<size_t>(0, output_length,
                             [&key, &diagonal, &hashed, key_length](size_t i)
                             {
                                 int bit = 0;
                                 const int *row = diagonal.data() + i;
                                 for (size_t j = 0; j < key_length; j++)
                                 {
                                     bit ^= row[key_length - 1 - j] & key[j];
                                 }
                                 hashed[i] = bit;
                             });
    pool.wait();
    return hashed;
}

std::vector<int> random_linear_hash(const std::vector<int> &key, size_t output_length, size_t seed, BS::thread_pool &pool)
{
    size_t key_length = key.size();
    if (key_length == 0 || output_length == 0 || output_length > key_length)
    {
        throw std::invalid_argument("Hash output length must be in [1, key length].");
    }

    std::vector<int> hashed(output_length);
    pool.detach_loop<size_t>(0, output_length,
                             [&key, &hashed, key_length, seed](size_t i)
                             {
                                 std::mt19937 row_prng = make_prng(seed, prng_stream::HASH_SELECTION, i + 1);
                                 std::vector<int> row = draw_bits(row_prng, key_length);
                                 int bit = 0;
                                 for (size_t j = 0; j < key_length; j++)
                                 {
                                     bit ^= row[j] & key[j];
                                 }
                                 hashed[i] = bit;
                             });
    pool.wait();
    return hashed;
}

std::vector<int> apply_universal_hash(const std::vector<int> &key, hash_family family, size_t seed, size_t output_length,
                                      BS::thread_pool &pool)
{
    switch (family)
    {
    case hash_family::TOEPLITZ:
        return toeplitz_hash(key, output_length, seed, pool);
    case hash_family::RANDOM_LINEAR:
        return random_linear_hash(key, output_length, seed, pool);
    }
    throw std::invalid_argument("Unknown hash family.");
}
