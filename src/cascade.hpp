#pragma once
#include <map>
#include <mutex>
#include <deque>
#include <atomic>
#include <string>
#include <vector>
#include <cstddef>

#include <BS_thread_pool.hpp>

#include "config.hpp"
#include "channel.hpp"
#include "leakage_ledger.hpp"

enum class reconciliation_state
{
    IDLE,
    PASS_IN_PROGRESS,
    BACKTRACK_PENDING,
    CONVERGED,
    ABORTED
};

std::string to_string(reconciliation_state state);

struct pass_descriptor
{
    size_t pass_index{};
    size_t block_size{};
    std::vector<size_t> permutation{}; // Identical on both sides: derived from the session seed and the pass index.
};

struct cascade_block
{
    size_t pass_index{};
    size_t begin{};          // Offset of the first member in the pass permutation.
    size_t end{};            // One past the last member.
    int reference_parity{};  // Learned from the reference party; never changes.
    int local_parity{};      // Parity of the corrector's current bits; toggled by every flip inside the block.
};

struct reconciliation_result
{
    reconciliation_state state{};
    size_t passes{};
    size_t bit_flips{};
    size_t block_parity_exchanges{};
    size_t bisection_queries{};
    size_t backtrack_enqueued{};    // Blocks put on the backtrack queue; a pending block is never added again.
    size_t backtrack_bisections{};  // Queued blocks that still disagreed when their turn came.
    size_t leakage{};
};

size_t select_initial_block_size(const pipeline_config &cfg, double qber_estimate, size_t key_length);
size_t block_size_for_pass(size_t initial_block_size, double growth_factor, size_t pass_index, size_t key_length);
std::vector<size_t> make_pass_permutation(size_t key_length, size_t pass_index, size_t seed);
pass_descriptor make_pass_descriptor(size_t key_length, size_t pass_index, size_t block_size, size_t seed);

// Corrector side of Cascade. Flips bits of the key it is given until every block of every pass agrees with
// the reference party's parities. The key is owned by the caller and mutated in place.
class cascade_corrector
{
public:
    cascade_corrector(std::vector<int> &key, classical_channel &channel, leakage_ledger &ledger,
                      const pipeline_config &cfg, BS::thread_pool &pool);

    // Throws qkd_failure with RECONCILIATION_FAILED when the pass limit or the leakage budget is exceeded.
    reconciliation_result reconcile(double qber_estimate);

    reconciliation_state state() const { return state_; }
    size_t current_pass() const { return current_pass_; }
    size_t bit_flips() const { return bit_flips_; }

private:
    size_t run_forward_pass(size_t pass_index, size_t block_size);
    void process_backtrack_queue();
    size_t bisect(size_t block_id);
    void apply_flip(size_t position, size_t source_block_id);
    void enqueue(size_t block_id);
    int query_reference_parity(size_t pass_index, size_t begin, size_t end);
    void charge(const disclosure_id &id);
    reconciliation_result make_result() const;

    std::vector<int> &key_;
    classical_channel &channel_;
    leakage_ledger &ledger_;
    const pipeline_config &cfg_;
    BS::thread_pool &pool_;

    reconciliation_state state_ = reconciliation_state::IDLE;
    size_t current_pass_{};
    size_t leakage_budget_{};
    size_t bit_flips_{};
    size_t backtrack_enqueued_{};
    size_t backtrack_bisections_{};
    std::atomic<size_t> block_parity_exchanges_{0};
    std::atomic<size_t> bisection_queries_{0};
    std::atomic<bool> budget_exceeded_{false};

    std::vector<pass_descriptor> passes_;
    std::vector<cascade_block> blocks_;                 // Arena of every block created so far.
    std::vector<std::vector<size_t>> membership_;       // Key index -> ids of the blocks containing it.
    std::deque<size_t> backtrack_queue_;
    std::vector<char> pending_;                         // Block id -> currently in backtrack_queue_.

    std::mutex cache_mutex_;
    std::map<disclosure_id, int> reference_parities_;
};
