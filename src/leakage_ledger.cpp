#include "leakage_ledger.hpp"

bool leakage_ledger::charge_parity(const disclosure_id &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!disclosed_.insert(id).second)
    {
        return false;
    }
    parity_bits_++;
    return true;
}

void leakage_ledger::record_sampled_bits(size_t count)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sampled_bits_ += count;
}

size_t leakage_ledger::parity_bits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return parity_bits_;
}

size_t leakage_ledger::sampled_bits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sampled_bits_;
}

void leakage_ledger::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    disclosed_.clear();
    parity_bits_ = 0;
    sampled_bits_ = 0;
}
