#pragma once
#include <set>
#include <mutex>
#include <atomic>
#include <chrono>
#include <thread>
#include <memory>
#include <vector>
#include <functional>

#include "channel.hpp"
#include "pipeline.hpp"
#include "qkd_error.hpp"
#include "reference_party.hpp"
#include "bit_array_operations.hpp"

// Alice's random key and Bob's copy with exactly `errors` flipped positions.
inline raw_key_pair make_key_pair(size_t length, size_t errors, size_t seed)
{
    std::mt19937 prng(static_cast<unsigned>(seed));
    raw_key_pair keys;
    keys.alice = generate_random_bit_array(prng, length);
    keys.bob = keys.alice;
    std::vector<size_t> positions = make_permutation(length, prng);
    for (size_t i = 0; i < errors; i++)
    {
        keys.bob[positions[i]] ^= 1;
    }
    return keys;
}

inline pipeline_config make_test_config()
{
    pipeline_config cfg;
    cfg.SAMPLE_FRACTION = 0.1;
    cfg.QBER_ABORT_THRESHOLD = 0.11;
    cfg.INITIAL_BLOCK_SIZE = 0;
    cfg.BLOCK_SIZE_GROWTH_FACTOR = 2.;
    cfg.MIN_PASSES = 4;
    cfg.MAX_PASSES = 16;
    cfg.LEAKAGE_BUDGET = 0;
    cfg.SECURITY_PARAMETER = 64;
    cfg.PRNG_SEED = 2024;
    cfg.CHANNEL_TIMEOUT_MS = 2000;
    cfg.CHANNEL_MAX_RETRIES = 3;
    cfg.WORKER_THREADS_NUMBER = 2;
    return cfg;
}

// Wraps another channel. Requests whose 1-based number is in `time_out_on` fail with TIMEOUT before reaching the
// other side; from request number `disconnect_at` on (0 = never) every request fails with CHANNEL_DISCONNECTED.
class scripted_channel : public classical_channel
{
public:
    explicit scripted_channel(classical_channel &inner) : inner_(inner) {}

    channel_message request(const channel_message &message, std::chrono::milliseconds timeout) override
    {
        size_t number;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            number = ++requests_;
            types_.push_back(message.type);
            if (observer)
            {
                observer(message);
            }
        }
        if (disconnect_at != 0 && number >= disconnect_at)
        {
            throw qkd_failure(failure_reason::CHANNEL_DISCONNECTED, "Scripted disconnect.");
        }
        if (time_out_on.count(number) != 0)
        {
            throw qkd_failure(failure_reason::TIMEOUT, "Scripted timeout.");
        }
        return inner_.request(message, timeout);
    }

    size_t requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t count(message_type type) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t matches = 0;
        for (message_type t : types_)
        {
            matches += static_cast<size_t>(t == type);
        }
        return matches;
    }

    std::set<size_t> time_out_on;
    size_t disconnect_at = 0;
    std::function<void(const channel_message &)> observer; // Called under the channel lock before each request.

private:
    classical_channel &inner_;
    mutable std::mutex mutex_;
    size_t requests_{};
    std::vector<message_type> types_;
};

// A reference party served on its own thread, the way a session sets it up.
struct reference_link
{
    reference_link(std::vector<int> key, const pipeline_config &cfg)
        : party(std::make_shared<reference_party>(std::move(key), cfg)),
          channel([p = party](const channel_message &request)
                  { return p->handle(request); })
    {
    }

    std::shared_ptr<reference_party> party;
    in_process_channel channel;
};

// Like reference_link, but the first request of `slow_type` is answered only after `delay`.
struct slow_reference_link
{
    slow_reference_link(std::vector<int> key, const pipeline_config &cfg, message_type slow_type, std::chrono::milliseconds delay)
        : party(std::make_shared<reference_party>(std::move(key), cfg)),
          handled(std::make_shared<std::atomic<size_t>>(0)),
          channel([p = party, h = handled, slow_type, delay, delayed = std::make_shared<std::atomic<bool>>(false)](const channel_message &request)
                  {
                      if (request.type == slow_type && !delayed->exchange(true))
                      {
                          std::this_thread::sleep_for(delay);
                      }
                      (*h)++;
                      return p->handle(request); })
    {
    }

    std::shared_ptr<reference_party> party;
    std::shared_ptr<std::atomic<size_t>> handled; // Requests the reference party has seen.
    in_process_channel channel;
};
