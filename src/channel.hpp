#pragma once
#include <map>
#include <deque>
#include <exception>
#include <mutex>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include <functional>
#include <condition_variable>

#include "config.hpp"

enum class message_type
{
    SAMPLE_DISCLOSE,    // indices -> reference bits at those indices, removed from both keys afterwards
    BLOCK_PARITY,       // pass_index, ranges -> one parity bit per range
    BISECT_QUERY,       // pass_index, one sub-block range -> its parity bit
    HASH_SEED_EXCHANGE, // seed, family, output_length -> acknowledgement
    ABORT,              // reason -> acknowledgement
    REPLY
};

std::string to_string(message_type type);

// Offsets [begin, end) into the permutation of a pass.
struct block_range
{
    size_t begin{};
    size_t end{};
};

// Everything in a message is public. Key bits only travel in the reply to SAMPLE_DISCLOSE.
struct channel_message
{
    message_type type{};
    size_t request_id{};   // Same on every retry of one request; 0 for requests that are never retried.
    std::vector<size_t> indices{};
    size_t pass_index{};
    std::vector<block_range> ranges{};
    std::vector<int> bits{};
    size_t seed{};
    hash_family family{};
    size_t output_length{};
    std::string reason{};
};

// Reliable, authenticated, publicly readable request/reply link to the other party.
class classical_channel
{
public:
    virtual ~classical_channel() = default;

    // Blocks until the reply arrives. Throws qkd_failure with TIMEOUT if none arrives in time and with
    // CHANNEL_DISCONNECTED if the link is gone.
    virtual channel_message request(const channel_message &message, std::chrono::milliseconds timeout) = 0;
};

using message_handler = std::function<channel_message(const channel_message &)>;

// Runs the remote party's handler on a dedicated responder thread. Requests and replies are copied across
// a queue, so the two parties never touch each other's buffers. Safe for concurrent requesters.
// A request whose id was already served is answered from the stored reply, so the handler sees every
// retried request once.
class in_process_channel : public classical_channel
{
public:
    explicit in_process_channel(message_handler handler);
    ~in_process_channel() override;

    in_process_channel(const in_process_channel &) = delete;
    in_process_channel &operator=(const in_process_channel &) = delete;

    channel_message request(const channel_message &message, std::chrono::milliseconds timeout) override;

    // Fails every pending and future request with CHANNEL_DISCONNECTED.
    void disconnect();

    size_t requests_served() const;

private:
    struct pending_request
    {
        size_t id{};
        channel_message message;
        std::promise<channel_message> reply;
    };

    struct served_reply
    {
        channel_message reply;
        std::exception_ptr error;
    };

    void serve();
    void answer(pending_request &pending);

    message_handler handler_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<pending_request> queue_;
    bool connected_ = true;
    size_t requests_served_{};
    size_t next_request_id_{};
    std::map<size_t, served_reply> served_; // Responder thread only.
    std::thread responder_;
};

// Sends a request and waits for its reply, retrying timeouts up to CHANNEL_MAX_RETRIES times before
// escalating to CHANNEL_DISCONNECTED. Every attempt carries the same request id.
channel_message exchange(classical_channel &channel, const channel_message &message, const pipeline_config &cfg);
