#include "qkd_error.hpp"

std::string to_string(failure_reason reason)
{
    switch (reason)
    {
    case failure_reason::CHANNEL_TOO_NOISY:
        return "ChannelTooNoisy";
    case failure_reason::RECONCILIATION_FAILED:
        return "ReconciliationFailed";
    case failure_reason::INSUFFICIENT_KEY_MATERIAL:
        return "InsufficientKeyMaterial";
    case failure_reason::CHANNEL_DISCONNECTED:
        return "ChannelDisconnected";
    case failure_reason::TIMEOUT:
        return "Timeout";
    }
    return "Unknown";
}

qkd_failure::qkd_failure(failure_reason reason, const std::string &message)
    : std::runtime_error(to_string(reason) + ": " + message), reason_(reason)
{
}
