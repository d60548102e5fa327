#include "reference_party.hpp"
#include "cascade.hpp"
#include "qkd_error.hpp"
#include "bit_array_operations.hpp"
#include "privacy_amplification.hpp"

#include <algorithm>
#include <stdexcept>

reference_party::reference_party(std::vector<int> key, const pipeline_config &cfg)
    : key_(std::move(key)), cfg_(cfg)
{
}

channel_message reference_party::handle(const channel_message &request)
{
    if (aborted_)
    {
        throw qkd_failure(failure_reason::CHANNEL_DISCONNECTED, "Session was aborted: " + abort_reason_);
    }

    switch (request.type)
    {
    case message_type::SAMPLE_DISCLOSE:
        return disclose_sample(request);
    case message_type::BLOCK_PARITY:
    case message_type::BISECT_QUERY:
        return disclose_parities(request);
    case message_type::HASH_SEED_EXCHANGE:
        return amplify(request);
    case message_type::ABORT:
        return abort_session(request);
    case message_type::REPLY:
        break;
    }
    throw std::invalid_argument("Reference party cannot serve " + to_string(request.type) + ".");
}

channel_message reference_party::disclose_sample(const channel_message &request)
{
    channel_message reply;
    reply.bits.reserve(request.indices.size());
    for (size_t index : request.indices)
    {
        if (index >= key_.size())
        {
            throw std::out_of_range("Sample position " + std::to_string(index) + " is outside of the key.");
        }
        reply.bits.push_back(key_[index]);
    }

    remove_positions(key_, request.indices);
    permutations_.clear();
    return reply;
}

channel_message reference_party::disclose_parities(const channel_message &request)
{
    const std::vector<size_t> &permutation = permutation_for_pass(request.pass_index);

    channel_message reply;
    reply.bits.reserve(request.ranges.size());
    for (const block_range &range : request.ranges)
    {
        if (range.begin >= range.end || range.end > key_.size())
        {
            throw std::out_of_range("Parity range [" + std::to_string(range.begin) + ", " + std::to_string(range.end) +
                                    ") is outside of the key.");
        }
        reply.bits.push_back(calculate_parity(key_, permutation, range.begin, range.end));
    }
    return reply;
}

channel_message reference_party::amplify(const channel_message &request)
{
    BS::thread_pool pool(cfg_.WORKER_THREADS_NUMBER);
    final_key_ = apply_universal_hash(key_, request.family, request.seed, request.output_length, pool);

    std::fill(key_.begin(), key_.end(), 0);
    key_.clear();
    permutations_.clear();
    return channel_message{};
}

channel_message reference_party::abort_session(const channel_message &request)
{
    aborted_ = true;
    abort_reason_ = request.reason;
    std::fill(key_.begin(), key_.end(), 0);
    key_.clear();
    final_key_.clear();
    permutations_.clear();
    return channel_message{};
}

const std::vector<size_t> &reference_party::permutation_for_pass(size_t pass_index)
{
    auto it = permutations_.find(pass_index);
    if (it == permutations_.end())
    {
        it = permutations_.emplace(pass_index, make_pass_permutation(key_.size(), pass_index, cfg_.PRNG_SEED)).first;
    }
    return it->second;
}
