#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <filesystem>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

enum class hash_family
{
    TOEPLITZ,
    RANDOM_LINEAR
};

std::string to_string(hash_family family);
hash_family parse_hash_family(const std::string &name);

// Options both parties agree on before a session starts. All of them are public.
struct pipeline_config
{
    // Fraction of the sifted key disclosed to estimate QBER
    double SAMPLE_FRACTION = 0.1;

    double QBER_ABORT_THRESHOLD = 0.11;

    // z-score of the Wald interval around the QBER estimate
    double QBER_CONFIDENCE_Z = 1.96;

    // 0 selects ceil(0.73 / QBER estimate)
    size_t INITIAL_BLOCK_SIZE = 0;

    double BLOCK_SIZE_GROWTH_FACTOR = 2.;

    // Passes required before convergence once a bit has been corrected
    size_t MIN_PASSES = 4;

    size_t MAX_PASSES = 16;

    // Bits; 0 means the reconciled key length
    size_t LEAKAGE_BUDGET = 0;

    // Lambda, in bits
    size_t SECURITY_PARAMETER = 64;

    // Extra bits subtracted for undetected residual reconciliation errors
    size_t RESIDUAL_ERROR_MARGIN = 0;

    size_t PRNG_SEED = 0;

    hash_family HASH_FAMILY = hash_family::TOEPLITZ;

    size_t CHANNEL_TIMEOUT_MS = 5000;

    size_t CHANNEL_MAX_RETRIES = 3;

    size_t WORKER_THREADS_NUMBER = 2;

    bool TRACE_QBER_SAMPLER{};

    bool TRACE_CASCADE{};

    bool TRACE_PRIVACY_AMPLIFICATION{};
};

struct config_data
{
    // Number of threads for parallelizing trials
    size_t THREADS_NUMBER{};

    // Number of runs with one QBER value
    size_t TRIALS_NUMBER{};

    // Seed of simulation
    size_t SIMULATION_SEED{};

    bool INTERACTIVE_MODE{};

    // Length of the sifted key handed to each session
    size_t KEY_LENGTH{};

    double QBER_BEGIN{};

    double QBER_END{};

    double QBER_STEP{};

    pipeline_config PIPELINE{};
};

void validate_pipeline_config(const pipeline_config &cfg);
pipeline_config get_pipeline_config(const json &config);
config_data parse_config_data(const json &config);
config_data get_config_data(fs::path config_path);
