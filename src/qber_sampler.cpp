#include "qber_sampler.hpp"
#include "qkd_error.hpp"
#include "bit_array_operations.hpp"

#include <cmath>
#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/color.h>

// Uniform subset of floor(key_length * sample_fraction) positions, drawn without replacement, sorted.
std::vector<size_t> select_sample_positions(size_t key_length, double sample_fraction, size_t seed)
{
    size_t sample_size = static_cast<size_t>(key_length * sample_fraction);
    std::mt19937 prng = make_prng(seed, prng_stream::SAMPLING);
    std::vector<size_t> positions = make_permutation(key_length, prng);
    positions.resize(sample_size);
    std::sort(positions.begin(), positions.end());
    return positions;
}

qber_estimate estimate_qber(size_t sample_size, size_t mismatches, double confidence_z)
{
    if (sample_size == 0)
    {
        throw qkd_failure(failure_reason::INSUFFICIENT_KEY_MATERIAL, "Key is too short to draw a QBER sample.");
    }
    if (mismatches > sample_size)
    {
        throw std::invalid_argument("Mismatches cannot exceed the sample size.");
    }

    qber_estimate estimate;
    estimate.sample_size = sample_size;
    estimate.mismatches = mismatches;
    estimate.qber = static_cast<double>(mismatches) / sample_size;
    estimate.confidence_margin = confidence_z * std::sqrt(estimate.qber * (1. - estimate.qber) / sample_size);
    return estimate;
}

void check_qber(const qber_estimate &estimate, double abort_threshold)
{
    if (estimate.qber + estimate.confidence_margin > abort_threshold)
    {
        throw qkd_failure(failure_reason::CHANNEL_TOO_NOISY,
                          fmt::format("QBER {:.4f} + {:.4f} exceeds threshold {:.4f} ({} of {} sampled bits differ).",
                                      estimate.qber, estimate.confidence_margin, abort_threshold, estimate.mismatches, estimate.sample_size));
    }
}

qber_estimate run_qber_sampling(std::vector<int> &key, classical_channel &channel, const pipeline_config &cfg, leakage_ledger &ledger)
{
    std::vector<size_t> positions = select_sample_positions(key.size(), cfg.SAMPLE_FRACTION, cfg.PRNG_SEED);
    if (positions.empty())
    {
        throw qkd_failure(failure_reason::INSUFFICIENT_KEY_MATERIAL, "Key of " + std::to_string(key.size()) + " bits is too short to sample.");
    }

    channel_message request;
    request.type = message_type::SAMPLE_DISCLOSE;
    request.indices = positions;
    channel_message reply = exchange(channel, request, cfg);
    if (reply.bits.size() != positions.size())
    {
        throw qkd_failure(failure_reason::CHANNEL_DISCONNECTED, "Sample reply has " + std::to_string(reply.bits.size()) +
                                                                    " bits, expected " + std::to_string(positions.size()) + ".");
    }

    size_t mismatches = 0;
    for (size_t i = 0; i < positions.size(); i++)
    {
        mismatches += static_cast<size_t>(key[positions[i]] != reply.bits[i]);
    }

    // Disclosed bits lost their secrecy; both sides drop them.
    remove_positions(key, positions);
    ledger.record_sampled_bits(positions.size());

    qber_estimate estimate = estimate_qber(positions.size(), mismatches, cfg.QBER_CONFIDENCE_Z);
    if (cfg.TRACE_QBER_SAMPLER)
    {
        fmt::print(fg(fmt::color::blue), "QBER sample: {} bits, {} mismatches, QBER {:.4f} +/- {:.4f}, {} bits left\n",
                   estimate.sample_size, estimate.mismatches, estimate.qber, estimate.confidence_margin, key.size());
    }
    check_qber(estimate, cfg.QBER_ABORT_THRESHOLD);
    return estimate;
}
