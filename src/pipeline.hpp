#pragma once
#include <vector>
#include <cstddef>

#include "config.hpp"
#include "channel.hpp"
#include "leakage_ledger.hpp"

// Sifted keys of both parties, index-aligned. Handed over by the raw key source at session start.
struct raw_key_pair
{
    std::vector<int> alice{};
    std::vector<int> bob{};
};

void validate_raw_key_pair(const raw_key_pair &keys);

struct session_diagnostics
{
    double estimated_qber{};
    double qber_confidence_margin{};
    size_t sample_size{};
    size_t sample_mismatches{};
    size_t reconciled_length{};  // Key length entering reconciliation, after sampled bits were removed.
    size_t passes{};
    size_t bit_flips{};
    size_t bisection_queries{};
    size_t leakage{};            // Parity bits disclosed during reconciliation.
    size_t final_length{};
};

// Result of a successful session. Never modified after construction.
class final_key
{
public:
    final_key(std::vector<int> bits, size_t security_parameter, size_t leakage_consumed, hash_family family,
              const session_diagnostics &diagnostics);

    const std::vector<int> &bits() const { return bits_; }
    size_t length() const { return bits_.size(); }
    size_t security_parameter() const { return security_parameter_; }
    size_t leakage_consumed() const { return leakage_consumed_; }
    hash_family family() const { return family_; }
    const session_diagnostics &diagnostics() const { return diagnostics_; }

private:
    std::vector<int> bits_;
    size_t security_parameter_;
    size_t leakage_consumed_;
    hash_family family_;
    session_diagnostics diagnostics_;
};

// Corrector side of a whole session: QBER sampling, Cascade, privacy amplification, in that order. Any failure
// sends a best-effort abort to the other party and rethrows; no key leaves this function unless every stage
// succeeded. `key` is consumed and wiped.
final_key run_corrector_pipeline(std::vector<int> key, classical_channel &channel, const pipeline_config &cfg, leakage_ledger &ledger);

// Runs a session with both parties in this process: Alice's key goes to a reference party behind an
// in_process_channel, Bob's key to the corrector pipeline. On success the reference party's final key is
// written to reference_key_out when given.
final_key run_qkd_session(raw_key_pair keys, const pipeline_config &cfg, std::vector<int> *reference_key_out = nullptr);
