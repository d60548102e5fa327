#pragma once
#include <map>
#include <vector>
#include <cstddef>

#include "config.hpp"
#include "channel.hpp"

// The party whose bits are never changed. It only answers requests; the corrector drives the session.
class reference_party
{
public:
    reference_party(std::vector<int> key, const pipeline_config &cfg);

    channel_message handle(const channel_message &request);

    size_t key_length() const { return key_.size(); }
    bool aborted() const { return aborted_; }
    const std::string &abort_reason() const { return abort_reason_; }

    // Empty until HASH_SEED_EXCHANGE has been served.
    const std::vector<int> &final_key_bits() const { return final_key_; }

private:
    channel_message disclose_sample(const channel_message &request);
    channel_message disclose_parities(const channel_message &request);
    channel_message amplify(const channel_message &request);
    channel_message abort_session(const channel_message &request);
    const std::vector<size_t> &permutation_for_pass(size_t pass_index);

    std::vector<int> key_;
    pipeline_config cfg_;
    std::map<size_t, std::vector<size_t>> permutations_;
    std::vector<int> final_key_;
    bool aborted_{};
    std::string abort_reason_;
};
