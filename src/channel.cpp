#include "channel.hpp"
#include "qkd_error.hpp"

#include <atomic>
#include <algorithm>

#include <fmt/core.h>
#include <fmt/color.h>

std::string to_string(message_type type)
{
    switch (type)
    {
    case message_type::SAMPLE_DISCLOSE:
        return "sampleDisclose";
    case message_type::BLOCK_PARITY:
        return "blockParity";
    case message_type::BISECT_QUERY:
        return "bisectQuery";
    case message_type::HASH_SEED_EXCHANGE:
        return "hashSeedExchange";
    case message_type::ABORT:
        return "abort";
    case message_type::REPLY:
        return "reply";
    }
    return "unknown";
}

in_process_channel::in_process_channel(message_handler handler)
    : handler_(std::move(handler))
{
    responder_ = std::thread(&in_process_channel::serve, this);
}

in_process_channel::~in_process_channel()
{
    disconnect();
    if (responder_.joinable())
    {
        responder_.join();
    }
}

channel_message in_process_channel::request(const channel_message &message, std::chrono::milliseconds timeout)
{
    std::future<channel_message> reply;
    size_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_)
        {
            throw qkd_failure(failure_reason::CHANNEL_DISCONNECTED, "Channel is closed, cannot send " + to_string(message.type) + ".");
        }
        id = next_request_id_++;
        queue_.push_back({id, message, std::promise<channel_message>()});
        reply = queue_.back().reply.get_future();
    }
    cv_.notify_one();

    if (reply.wait_for(timeout) != std::future_status::ready)
    {
        // A request still waiting in the queue is withdrawn, so a retry is not served twice.
        std::lock_guard<std::mutex> lock(mutex_);
        auto queued = std::find_if(queue_.begin(), queue_.end(), [id](const pending_request &pending)
                                   { return pending.id == id; });
        if (queued != queue_.end())
        {
            queue_.erase(queued);
        }
        throw qkd_failure(failure_reason::TIMEOUT, "No reply to " + to_string(message.type) + " within " +
                                                       std::to_string(timeout.count()) + " ms.");
    }
    return reply.get();
}

void in_process_channel::disconnect()
{
    std::deque<pending_request> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        dropped.swap(queue_);
    }
    cv_.notify_all();

    for (auto &pending : dropped)
    {
        pending.reply.set_exception(std::make_exception_ptr(
            qkd_failure(failure_reason::CHANNEL_DISCONNECTED, "Channel closed before " + to_string(pending.message.type) + " was served.")));
    }
}

size_t in_process_channel::requests_served() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_served_;
}

void in_process_channel::serve()
{
    while (true)
    {
        pending_request pending;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]()
                     { return !connected_ || !queue_.empty(); });
            if (!connected_)
            {
                return;
            }
            pending = std::move(queue_.front());
            queue_.pop_front();
        }

        answer(pending);
    }
}

void in_process_channel::answer(pending_request &pending)
{
    size_t request_id = pending.message.request_id;
    if (request_id != 0)
    {
        auto served = served_.find(request_id);
        if (served != served_.end())
        {
            if (served->second.error)
            {
                pending.reply.set_exception(served->second.error);
            }
            else
            {
                pending.reply.set_value(served->second.reply);
            }
            return;
        }
    }

    served_reply result;
    try
    {
        result.reply = handler_(pending.message);
        result.reply.type = message_type::REPLY;
        result.reply.request_id = request_id;
    }
    catch (...)
    {
        // Handler failures belong to the requester.
        result.error = std::current_exception();
    }

    if (result.error)
    {
        pending.reply.set_exception(result.error);
    }
    else
    {
        pending.reply.set_value(result.reply);
    }
    if (request_id != 0)
    {
        served_.emplace(request_id, std::move(result));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    requests_served_++;
}

static std::atomic<size_t> next_exchange_id{1};

channel_message exchange(classical_channel &channel, const channel_message &message, const pipeline_config &cfg)
{
    channel_message tagged = message;
    if (tagged.request_id == 0)
    {
        tagged.request_id = next_exchange_id++;
    }

    std::chrono::milliseconds timeout(cfg.CHANNEL_TIMEOUT_MS);
    for (size_t attempt = 0; attempt <= cfg.CHANNEL_MAX_RETRIES; attempt++)
    {
        try
        {
            channel_message reply = channel.request(tagged, timeout);
            if (reply.type != message_type::REPLY)
            {
                throw qkd_failure(failure_reason::CHANNEL_DISCONNECTED, "Unexpected " + to_string(reply.type) +
                                                                            " in answer to " + to_string(message.type) + ".");
            }
            return reply;
        }
        catch (const qkd_failure &e)
        {
            if (e.reason() != failure_reason::TIMEOUT)
            {
                throw;
            }
            fmt::print(stderr, fg(fmt::color::yellow), "{} (attempt {}/{})\n", e.what(), attempt + 1, cfg.CHANNEL_MAX_RETRIES + 1);
        }
    }
    throw qkd_failure(failure_reason::CHANNEL_DISCONNECTED, to_string(message.type) + " timed out " +
                                                                std::to_string(cfg.CHANNEL_MAX_RETRIES + 1) + " times.");
}
