#pragma once
#include <vector>
#include <cstddef>

#include "config.hpp"
#include "channel.hpp"
#include "leakage_ledger.hpp"

struct qber_estimate
{
    size_t sample_size{};
    size_t mismatches{};
    double qber{};               // mismatches / sample_size
    double confidence_margin{};  // Half-width of the Wald interval around qber.
};

std::vector<size_t> select_sample_positions(size_t key_length, double sample_fraction, size_t seed);
qber_estimate estimate_qber(size_t sample_size, size_t mismatches, double confidence_z);
void check_qber(const qber_estimate &estimate, double abort_threshold);

// Corrector side of QBER estimation. Asks the reference party for its bits at randomly chosen positions, compares
// them with its own and removes the sampled positions from the key. Throws qkd_failure with CHANNEL_TOO_NOISY
// when the estimate plus its margin exceeds QBER_ABORT_THRESHOLD.
qber_estimate run_qber_sampling(std::vector<int> &key, classical_channel &channel, const pipeline_config &cfg, leakage_ledger &ledger);
