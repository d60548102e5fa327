#pragma once
#include <set>
#include <mutex>
#include <tuple>
#include <cstddef>

// Identifies the index subset whose parity was disclosed: offsets [begin, end) of the permutation of one pass.
struct disclosure_id
{
    size_t pass_index{};
    size_t begin{};
    size_t end{};

    bool operator<(const disclosure_id &other) const
    {
        return std::tie(pass_index, begin, end) < std::tie(other.pass_index, other.begin, other.end);
    }
};

// Per-session count of bits disclosed over the public channel. Never decremented; cleared only by reset()
// at session start. Safe for concurrent use by bisections of different blocks.
class leakage_ledger
{
public:
    // Charges one bit for a parity disclosure. The reference key never changes, so disclosing the parity of a
    // subset that was already disclosed adds nothing and is not charged again. Returns true if charged.
    bool charge_parity(const disclosure_id &id);

    // Sampled bits are removed from the key entirely; they are tracked apart from parity leakage.
    void record_sampled_bits(size_t count);

    size_t parity_bits() const;
    size_t sampled_bits() const;

    void reset();

private:
    mutable std::mutex mutex_;
    std::set<disclosure_id> disclosed_;
    size_t parity_bits_{};
    size_t sampled_bits_{};
};
