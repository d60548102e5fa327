#include "pipeline.hpp"
#include "cascade.hpp"
#include "qkd_error.hpp"
#include "qber_sampler.hpp"
#include "reference_party.hpp"
#include "privacy_amplification.hpp"

#include <memory>
#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/color.h>
#include <BS_thread_pool.hpp>

void validate_raw_key_pair(const raw_key_pair &keys)
{
    if (keys.alice.size() != keys.bob.size())
    {
        throw std::invalid_argument("Raw keys have different lengths: " + std::to_string(keys.alice.size()) + " and " +
                                    std::to_string(keys.bob.size()) + ".");
    }
    auto not_a_bit = [](int bit)
    {
        return bit != 0 && bit != 1;
    };
    if (std::any_of(keys.alice.begin(), keys.alice.end(), not_a_bit) || std::any_of(keys.bob.begin(), keys.bob.end(), not_a_bit))
    {
        throw std::invalid_argument("Raw keys must contain only 0 and 1.");
    }
}

final_key::final_key(std::vector<int> bits, size_t security_parameter, size_t leakage_consumed, hash_family family,
                     const session_diagnostics &diagnostics)
    : bits_(std::move(bits)), security_parameter_(security_parameter), leakage_consumed_(leakage_consumed), family_(family),
      diagnostics_(diagnostics)
{
}

// Tells the reference party to wipe its key. Nothing to tell when the link itself is gone.
static void send_abort(classical_channel &channel, const std::string &reason, const pipeline_config &cfg)
{
    channel_message request;
    request.type = message_type::ABORT;
    request.reason = reason;
    try
    {
        channel.request(request, std::chrono::milliseconds(cfg.CHANNEL_TIMEOUT_MS));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, fg(fmt::color::yellow), "Abort was not delivered: {}\n", e.what());
    }
}

final_key run_corrector_pipeline(std::vector<int> key, classical_channel &channel, const pipeline_config &cfg, leakage_ledger &ledger)
{
    validate_pipeline_config(cfg);
    ledger.reset();

    BS::thread_pool pool(cfg.WORKER_THREADS_NUMBER);
    session_diagnostics diagnostics;
    try
    {
        qber_estimate estimate = run_qber_sampling(key, channel, cfg, ledger);
        diagnostics.estimated_qber = estimate.qber;
        diagnostics.qber_confidence_margin = estimate.confidence_margin;
        diagnostics.sample_size = estimate.sample_size;
        diagnostics.sample_mismatches = estimate.mismatches;
        diagnostics.reconciled_length = key.size();

        cascade_corrector corrector(key, channel, ledger, cfg, pool);
        reconciliation_result reconciliation = corrector.reconcile(estimate.qber);
        diagnostics.passes = reconciliation.passes;
        diagnostics.bit_flips = reconciliation.bit_flips;
        diagnostics.bisection_queries = reconciliation.bisection_queries;
        diagnostics.leakage = ledger.parity_bits();

        size_t output_length = privacy_amplification_length(key.size(), diagnostics.leakage, cfg.SECURITY_PARAMETER,
                                                            cfg.RESIDUAL_ERROR_MARGIN);

        // Both sides must hold the same hash function before either compresses.
        channel_message seed_exchange;
        seed_exchange.type = message_type::HASH_SEED_EXCHANGE;
        seed_exchange.seed = select_hash_seed(cfg.PRNG_SEED);
        seed_exchange.family = cfg.HASH_FAMILY;
        seed_exchange.output_length = output_length;
        exchange(channel, seed_exchange, cfg);

        std::vector<int> bits = apply_universal_hash(key, cfg.HASH_FAMILY, seed_exchange.seed, output_length, pool);
        std::fill(key.begin(), key.end(), 0);
        diagnostics.final_length = bits.size();

        if (cfg.TRACE_PRIVACY_AMPLIFICATION)
        {
            fmt::print(fg(fmt::color::blue), "Privacy amplification ({}): {} bits - leakage {} - lambda {} - margin {} = {} bits\n",
                       to_string(cfg.HASH_FAMILY), diagnostics.reconciled_length, diagnostics.leakage, cfg.SECURITY_PARAMETER,
                       cfg.RESIDUAL_ERROR_MARGIN, output_length);
        }
        return final_key(std::move(bits), cfg.SECURITY_PARAMETER, diagnostics.leakage, cfg.HASH_FAMILY, diagnostics);
    }
    catch (const qkd_failure &e)
    {
        std::fill(key.begin(), key.end(), 0);
        if (e.reason() != failure_reason::CHANNEL_DISCONNECTED)
        {
            send_abort(channel, to_string(e.reason()), cfg);
        }
        throw;
    }
    catch (const std::exception &e)
    {
        std::fill(key.begin(), key.end(), 0);
        send_abort(channel, e.what(), cfg);
        throw;
    }
}

final_key run_qkd_session(raw_key_pair keys, const pipeline_config &cfg, std::vector<int> *reference_key_out)
{
    validate_raw_key_pair(keys);

    auto reference = std::make_shared<reference_party>(std::move(keys.alice), cfg);
    in_process_channel channel([reference](const channel_message &request)
                               { return reference->handle(request); });

    leakage_ledger ledger;
    final_key key = run_corrector_pipeline(std::move(keys.bob), channel, cfg, ledger);
    if (reference_key_out != nullptr)
    {
        *reference_key_out = reference->final_key_bits();
    }
    return key;
}
