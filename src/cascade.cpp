#include "cascade.hpp"
#include "qkd_error.hpp"
#include "bit_array_operations.hpp"

#include <cmath>
#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/color.h>

// Below this estimate the first block would cover most of the key and hide nearly everything.
constexpr double MIN_QBER_FOR_BLOCK_SIZE = 0.005;

std::string to_string(reconciliation_state state)
{
    switch (state)
    {
    case reconciliation_state::IDLE:
        return "Idle";
    case reconciliation_state::PASS_IN_PROGRESS:
        return "PassInProgress";
    case reconciliation_state::BACKTRACK_PENDING:
        return "BacktrackPending";
    case reconciliation_state::CONVERGED:
        return "Converged";
    case reconciliation_state::ABORTED:
        return "Aborted";
    }
    return "Unknown";
}

// Uses the configured size, or the classic 0.73 / QBER rule when none is configured.
size_t select_initial_block_size(const pipeline_config &cfg, double qber_estimate, size_t key_length)
{
    size_t block_size = cfg.INITIAL_BLOCK_SIZE;
    if (block_size == 0)
    {
        double qber = std::max(qber_estimate, MIN_QBER_FOR_BLOCK_SIZE);
        block_size = static_cast<size_t>(std::ceil(0.73 / qber));
    }
    return std::max<size_t>(1, std::min(block_size, key_length));
}

size_t block_size_for_pass(size_t initial_block_size, double growth_factor, size_t pass_index, size_t key_length)
{
    double block_size = static_cast<double>(initial_block_size) * std::pow(growth_factor, static_cast<double>(pass_index - 1));
    if (block_size >= static_cast<double>(key_length))
    {
        return key_length;
    }
    return std::max<size_t>(1, static_cast<size_t>(std::llround(block_size)));
}

std::vector<size_t> make_pass_permutation(size_t key_length, size_t pass_index, size_t seed)
{
    std::mt19937 prng = make_prng(seed, prng_stream::PERMUTATION, pass_index);
    return make_permutation(key_length, prng);
}

pass_descriptor make_pass_descriptor(size_t key_length, size_t pass_index, size_t block_size, size_t seed)
{
    return {pass_index, block_size, make_pass_permutation(key_length, pass_index, seed)};
}

cascade_corrector::cascade_corrector(std::vector<int> &key, classical_channel &channel, leakage_ledger &ledger,
                                     const pipeline_config &cfg, BS::thread_pool &pool)
    : key_(key), channel_(channel), ledger_(ledger), cfg_(cfg), pool_(pool)
{
}

reconciliation_result cascade_corrector::reconcile(double qber_estimate)
{
    if (state_ != reconciliation_state::IDLE)
    {
        throw std::logic_error("Reconciliation has already run on this corrector.");
    }

    size_t key_length = key_.size();
    if (key_length == 0)
    {
        state_ = reconciliation_state::ABORTED;
        throw qkd_failure(failure_reason::INSUFFICIENT_KEY_MATERIAL, "Nothing left to reconcile.");
    }

    leakage_budget_ = (cfg_.LEAKAGE_BUDGET == 0) ? key_length : cfg_.LEAKAGE_BUDGET;
    membership_.assign(key_length, {});
    size_t initial_block_size = select_initial_block_size(cfg_, qber_estimate, key_length);

    if (cfg_.TRACE_CASCADE)
    {
        fmt::print(fg(fmt::color::blue), "Cascade: key length {}, initial block size {}, leakage budget {}\n",
                   key_length, initial_block_size, leakage_budget_);
    }

    try
    {
        for (size_t pass_index = 1; pass_index <= cfg_.MAX_PASSES; pass_index++)
        {
            current_pass_ = pass_index;
            size_t block_size = block_size_for_pass(initial_block_size, cfg_.BLOCK_SIZE_GROWTH_FACTOR, pass_index, key_length);

            state_ = reconciliation_state::PASS_IN_PROGRESS;
            size_t mismatched_blocks = run_forward_pass(pass_index, block_size);

            if (!backtrack_queue_.empty())
            {
                state_ = reconciliation_state::BACKTRACK_PENDING;
                process_backtrack_queue();
            }

            if (cfg_.TRACE_CASCADE)
            {
                fmt::print(fg(fmt::color::blue), "Pass {}: block size {}, mismatched blocks {}, total flips {}, leakage {}\n",
                           pass_index, block_size, mismatched_blocks, bit_flips_, ledger_.parity_bits());
            }

            // A run that never corrected anything trusts its first clean pass.
            if (mismatched_blocks == 0 && (bit_flips_ == 0 || pass_index >= cfg_.MIN_PASSES))
            {
                state_ = reconciliation_state::CONVERGED;
                return make_result();
            }
        }
    }
    catch (const std::exception &e)
    {
        state_ = reconciliation_state::ABORTED;
        if (cfg_.TRACE_CASCADE)
        {
            fmt::print(fg(fmt::color::blue), "Cascade aborted in pass {}: {}\n", current_pass_, e.what());
        }
        throw;
    }

    state_ = reconciliation_state::ABORTED;
    throw qkd_failure(failure_reason::RECONCILIATION_FAILED, "No clean pass within " + std::to_string(cfg_.MAX_PASSES) + " passes.");
}

// Splits the key along this pass's permutation, exchanges block parities and bisects every block that
// disagrees. Returns the number of disagreeing blocks.
size_t cascade_corrector::run_forward_pass(size_t pass_index, size_t block_size)
{
    size_t key_length = key_.size();
    passes_.push_back(make_pass_descriptor(key_length, pass_index, block_size, cfg_.PRNG_SEED));
    const std::vector<size_t> &permutation = passes_.back().permutation;

    size_t first_block_id = blocks_.size();
    size_t blocks_number = (key_length + block_size - 1) / block_size;
    for (size_t b = 0; b < blocks_number; b++)
    {
        cascade_block block;
        block.pass_index = pass_index;
        block.begin = b * block_size;
        block.end = std::min(key_length, block.begin + block_size);
        blocks_.push_back(block);
    }
    pending_.resize(blocks_.size(), 0);

    pool_.detach_loop<size_t>(first_block_id, blocks_.size(),
                              [this, &permutation](size_t id)
                              {
                                  blocks_[id].local_parity = calculate_parity(key_, permutation, blocks_[id].begin, blocks_[id].end);
                              });
    pool_.wait();

    channel_message request;
    request.type = message_type::BLOCK_PARITY;
    request.pass_index = pass_index;
    for (size_t id = first_block_id; id < blocks_.size(); id++)
    {
        request.ranges.push_back({blocks_[id].begin, blocks_[id].end});
        for (size_t i = blocks_[id].begin; i < blocks_[id].end; i++)
        {
            membership_[permutation[i]].push_back(id);
        }
    }

    channel_message reply = exchange(channel_, request, cfg_);
    if (reply.bits.size() != blocks_number)
    {
        throw qkd_failure(failure_reason::CHANNEL_DISCONNECTED, "Block parity reply has " + std::to_string(reply.bits.size()) +
                                                                    " bits, expected " + std::to_string(blocks_number) + ".");
    }
    block_parity_exchanges_ += blocks_number;

    std::vector<size_t> mismatched;
    for (size_t b = 0; b < blocks_number; b++)
    {
        cascade_block &block = blocks_[first_block_id + b];
        block.reference_parity = reply.bits[b];
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            reference_parities_[{pass_index, block.begin, block.end}] = block.reference_parity;
        }
        charge({pass_index, block.begin, block.end});
        if (block.reference_parity != block.local_parity)
        {
            mismatched.push_back(first_block_id + b);
        }
    }

    // Blocks of one pass are disjoint, so their bisections can run side by side.
    std::vector<size_t> flipped(mismatched.size());
    BS::multi_future<void> bisections = pool_.submit_loop<size_t>(0, mismatched.size(),
                                                                  [this, &mismatched, &flipped](size_t k)
                                                                  {
                                                                      flipped[k] = bisect(mismatched[k]);
                                                                  });
    bisections.wait();
    bisections.get();

    for (size_t k = 0; k < mismatched.size(); k++)
    {
        apply_flip(flipped[k], mismatched[k]);
    }
    return mismatched.size();
}

// Re-bisects blocks of earlier passes whose parity went stale after a flip, until none is left.
void cascade_corrector::process_backtrack_queue()
{
    while (!backtrack_queue_.empty())
    {
        size_t block_id = backtrack_queue_.front();
        backtrack_queue_.pop_front();
        pending_[block_id] = 0;

        // Another flip may already have restored agreement.
        if (blocks_[block_id].local_parity == blocks_[block_id].reference_parity)
        {
            continue;
        }
        backtrack_bisections_++;
        size_t position = bisect(block_id);
        apply_flip(position, block_id);
    }
}

// Binary search for one erroneous bit inside a block with an odd number of errors. Flips that bit in the key
// and returns its position. Each queried half costs one disclosed parity bit.
size_t cascade_corrector::bisect(size_t block_id)
{
    const cascade_block &block = blocks_[block_id];
    const std::vector<size_t> &permutation = passes_[block.pass_index - 1].permutation;

    size_t begin = block.begin;
    size_t end = block.end;
    while (end - begin > 1)
    {
        size_t middle = begin + (end - begin) / 2;
        int reference_parity = query_reference_parity(block.pass_index, begin, middle);
        int local_parity = calculate_parity(key_, permutation, begin, middle);
        if (reference_parity != local_parity)
        {
            end = middle;
        }
        else
        {
            begin = middle;
        }
    }

    size_t position = permutation[begin];
    key_[position] ^= 1;
    return position;
}

// Propagates a flip to every block containing the position. Blocks that now disagree are queued for bisection.
void cascade_corrector::apply_flip(size_t position, size_t source_block_id)
{
    bit_flips_++;
    for (size_t block_id : membership_[position])
    {
        cascade_block &block = blocks_[block_id];
        block.local_parity ^= 1;
        if (block_id != source_block_id && block.local_parity != block.reference_parity)
        {
            enqueue(block_id);
        }
    }
}

void cascade_corrector::enqueue(size_t block_id)
{
    if (pending_[block_id])
    {
        return;
    }
    pending_[block_id] = 1;
    backtrack_queue_.push_back(block_id);
    backtrack_enqueued_++;
}

int cascade_corrector::query_reference_parity(size_t pass_index, size_t begin, size_t end)
{
    disclosure_id id{pass_index, begin, end};
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto cached = reference_parities_.find(id);
        if (cached != reference_parities_.end())
        {
            return cached->second;
        }
    }
    if (budget_exceeded_)
    {
        throw qkd_failure(failure_reason::RECONCILIATION_FAILED, "Leakage budget exceeded.");
    }

    channel_message request;
    request.type = message_type::BISECT_QUERY;
    request.pass_index = pass_index;
    request.ranges.push_back({begin, end});
    channel_message reply = exchange(channel_, request, cfg_);
    if (reply.bits.size() != 1)
    {
        throw qkd_failure(failure_reason::CHANNEL_DISCONNECTED, "Bisection reply must carry exactly one parity bit.");
    }
    bisection_queries_++;

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        reference_parities_[id] = reply.bits[0];
    }
    charge(id);
    return reply.bits[0];
}

void cascade_corrector::charge(const disclosure_id &id)
{
    if (ledger_.charge_parity(id) && ledger_.parity_bits() > leakage_budget_)
    {
        budget_exceeded_ = true;
    }
    if (budget_exceeded_)
    {
        throw qkd_failure(failure_reason::RECONCILIATION_FAILED, "Leakage " + std::to_string(ledger_.parity_bits()) +
                                                                     " exceeds budget " + std::to_string(leakage_budget_) + ".");
    }
}

reconciliation_result cascade_corrector::make_result() const
{
    reconciliation_result result;
    result.state = state_;
    result.passes = current_pass_;
    result.bit_flips = bit_flips_;
    result.block_parity_exchanges = block_parity_exchanges_;
    result.bisection_queries = bisection_queries_;
    result.backtrack_enqueued = backtrack_enqueued_;
    result.backtrack_bisections = backtrack_bisections_;
    result.leakage = ledger_.parity_bits();
    return result;
}
