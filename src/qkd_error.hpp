#pragma once
#include <string>
#include <stdexcept>

// Reasons a session can end without a key. Every one of them is fatal to the session.
enum class failure_reason
{
    CHANNEL_TOO_NOISY,         // QBER estimate plus its confidence margin exceeds the abort threshold.
    RECONCILIATION_FAILED,     // Pass limit or leakage budget exceeded.
    INSUFFICIENT_KEY_MATERIAL, // Nothing left to extract after leakage and security margin.
    CHANNEL_DISCONNECTED,      // Channel closed, or a request ran out of retries.
    TIMEOUT                    // A single request got no reply in time. Retried before escalating.
};

std::string to_string(failure_reason reason);

class qkd_failure : public std::runtime_error
{
public:
    qkd_failure(failure_reason reason, const std::string &message);

    failure_reason reason() const noexcept { return reason_; }

private:
    failure_reason reason_;
};
