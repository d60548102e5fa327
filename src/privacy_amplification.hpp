#pragma once
#include <vector>
#include <cstddef>

#include <BS_thread_pool.hpp>

#include "config.hpp"

// l = n - L - lambda - residual margin. Throws qkd_failure with INSUFFICIENT_KEY_MATERIAL when l <= 0.
size_t privacy_amplification_length(size_t key_length, size_t leakage, size_t security_parameter, size_t residual_error_margin);

// Seed published over the channel to select the hash function. Derived from the session seed.
size_t select_hash_seed(size_t prng_seed);

// Multiplies the key by an output_length x n Toeplitz matrix over GF(2). The matrix is fixed by n + output_length - 1
// bits drawn from the seed.
std::vector<int> toeplitz_hash(const std::vector<int> &key, size_t output_length, size_t seed, BS::thread_pool &pool);

// Multiplies the key by a fully random output_length x n binary matrix. Row i is drawn from its own stream of the seed.
std::vector<int> random_linear_hash(const std::vector<int> &key, size_t output_length, size_t seed, BS::thread_pool &pool);

std::vector<int> apply_universal_hash(const std::vector<int> &key, hash_family family, size_t seed, size_t output_length,
                                      BS::thread_pool &pool);
