#include "config.hpp"

#include <ctime>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/color.h>

std::string to_string(hash_family family)
{
    switch (family)
    {
    case hash_family::TOEPLITZ:
        return "toeplitz";
    case hash_family::RANDOM_LINEAR:
        return "random_linear";
    }
    return "unknown";
}

hash_family parse_hash_family(const std::string &name)
{
    if (name == "toeplitz")
    {
        return hash_family::TOEPLITZ;
    }
    if (name == "random_linear")
    {
        return hash_family::RANDOM_LINEAR;
    }
    throw std::runtime_error("Unknown hash family: '" + name + "'. Expected 'toeplitz' or 'random_linear'.");
}

void validate_pipeline_config(const pipeline_config &cfg)
{
    if (cfg.SAMPLE_FRACTION <= 0. || cfg.SAMPLE_FRACTION >= 1.)
    {
        throw std::runtime_error("Sample fraction must be: 0 < f < 1!");
    }
    if (cfg.QBER_ABORT_THRESHOLD <= 0. || cfg.QBER_ABORT_THRESHOLD >= 0.5)
    {
        throw std::runtime_error("QBER abort threshold must be: 0 < threshold < 0.5!");
    }
    if (cfg.QBER_CONFIDENCE_Z < 0.)
    {
        throw std::runtime_error("QBER confidence z-score must be >= 0!");
    }
    if (cfg.BLOCK_SIZE_GROWTH_FACTOR < 1.)
    {
        throw std::runtime_error("Block size growth factor must be >= 1!");
    }
    if (cfg.MAX_PASSES < 1)
    {
        throw std::runtime_error("Maximum number of passes must be >= 1!");
    }
    if (cfg.MIN_PASSES < 1 || cfg.MIN_PASSES > cfg.MAX_PASSES)
    {
        throw std::runtime_error("Minimum number of passes must be: 1 <= min_passes <= max_passes!");
    }
    if (cfg.CHANNEL_TIMEOUT_MS < 1)
    {
        throw std::runtime_error("Channel timeout must be >= 1 ms!");
    }
    if (cfg.WORKER_THREADS_NUMBER < 1)
    {
        throw std::runtime_error("Number of worker threads must be >= 1!");
    }
}

pipeline_config get_pipeline_config(const json &config)
{
    pipeline_config cfg{};
    cfg.SAMPLE_FRACTION = config.at("sample_fraction").template get<double>();
    cfg.QBER_ABORT_THRESHOLD = config.at("qber_abort_threshold").template get<double>();
    cfg.QBER_CONFIDENCE_Z = config.value("qber_confidence_z", cfg.QBER_CONFIDENCE_Z);
    cfg.INITIAL_BLOCK_SIZE = config.at("initial_block_size").template get<size_t>();
    cfg.BLOCK_SIZE_GROWTH_FACTOR = config.at("block_size_growth_factor").template get<double>();
    cfg.MIN_PASSES = config.value("min_passes", cfg.MIN_PASSES);
    cfg.MAX_PASSES = config.at("max_passes").template get<size_t>();
    cfg.LEAKAGE_BUDGET = config.at("leakage_budget").template get<size_t>();
    cfg.SECURITY_PARAMETER = config.at("security_parameter").template get<size_t>();
    cfg.RESIDUAL_ERROR_MARGIN = config.value("residual_error_margin", cfg.RESIDUAL_ERROR_MARGIN);
    cfg.PRNG_SEED = config.at("prng_seed").template get<size_t>();
    cfg.HASH_FAMILY = parse_hash_family(config.at("hash_family").template get<std::string>());
    cfg.CHANNEL_TIMEOUT_MS = config.value("channel_timeout_ms", cfg.CHANNEL_TIMEOUT_MS);
    cfg.CHANNEL_MAX_RETRIES = config.value("channel_max_retries", cfg.CHANNEL_MAX_RETRIES);
    cfg.WORKER_THREADS_NUMBER = config.value("worker_threads_number", cfg.WORKER_THREADS_NUMBER);
    cfg.TRACE_QBER_SAMPLER = config.value("trace_qber_sampler", false);
    cfg.TRACE_CASCADE = config.value("trace_cascade", false);
    cfg.TRACE_PRIVACY_AMPLIFICATION = config.value("trace_privacy_amplification", false);

    validate_pipeline_config(cfg);
    return cfg;
}

config_data parse_config_data(const json &config)
{
    if (config.empty())
    {
        throw std::runtime_error("Configuration is empty.");
    }

    try
    {
        config_data cfg{};
        cfg.THREADS_NUMBER = config.at("threads_number").template get<size_t>();
        if (cfg.THREADS_NUMBER < 1)
        {
            throw std::runtime_error("Number of threads must be >= 1!");
        }

        cfg.TRIALS_NUMBER = config.at("trials_number").template get<size_t>();
        if (cfg.TRIALS_NUMBER < 1)
        {
            throw std::runtime_error("Number of trials must be >= 1!");
        }

        if (config.at("use_config_simulation_seed").template get<bool>())
        {
            cfg.SIMULATION_SEED = config.at("simulation_seed").template get<size_t>();
        }
        else
        {
            cfg.SIMULATION_SEED = time(nullptr);
        }

        cfg.INTERACTIVE_MODE = config.at("interactive_mode").template get<bool>();

        cfg.KEY_LENGTH = config.at("key_length").template get<size_t>();
        if (cfg.KEY_LENGTH < 2)
        {
            throw std::runtime_error("Key length must be >= 2!");
        }

        cfg.QBER_BEGIN = config.at("QBER_begin").template get<double>();
        cfg.QBER_END = config.at("QBER_end").template get<double>();
        cfg.QBER_STEP = config.at("QBER_step").template get<double>();
        if (cfg.QBER_BEGIN < 0. || cfg.QBER_BEGIN >= 0.5 || cfg.QBER_END < 0. || cfg.QBER_END >= 0.5 || cfg.QBER_BEGIN > cfg.QBER_END)
        {
            throw std::runtime_error("Invalid QBER begin or end parameters. QBER must be: 0 <= QBER < 0.5, and begin must not exceed end.");
        }
        if (cfg.QBER_STEP <= 0.)
        {
            throw std::runtime_error("QBER step must be > 0!");
        }
        if (cfg.QBER_BEGIN < cfg.QBER_END && cfg.QBER_STEP > cfg.QBER_END - cfg.QBER_BEGIN)
        {
            throw std::runtime_error("QBER step is too large.");
        }

        cfg.PIPELINE = get_pipeline_config(config.at("pipeline"));
        return cfg;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, fg(fmt::color::red), "An error occurred while reading a configuration parameter.\n");
        throw;
    }
}

config_data get_config_data(fs::path config_path)
{
    if (!fs::exists(config_path))
    {
        throw std::runtime_error("Configuration file not found: " + config_path.string());
    }

    std::ifstream config_file(config_path);
    if (!config_file.is_open())
    {
        throw std::runtime_error("Failed to open configuration file: " + config_path.string());
    }

    json config = json::parse(config_file);
    config_file.close();
    if (config.empty())
    {
        throw std::runtime_error("Configuration file is empty: " + config_path.string());
    }
    return parse_config_data(config);
}
