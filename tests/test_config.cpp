#include <catch2/catch.hpp>

#include <string>
#include <fstream>

#include "config.hpp"
#include "utils.hpp"

static json make_pipeline_json()
{
    return json{
        {"sample_fraction", 0.2},
        {"qber_abort_threshold", 0.1},
        {"initial_block_size", 16},
        {"block_size_growth_factor", 2.0},
        {"max_passes", 10},
        {"leakage_budget", 500},
        {"security_parameter", 80},
        {"prng_seed", 7},
        {"hash_family", "random_linear"}};
}

static json make_config_json()
{
    return json{
        {"threads_number", 2},
        {"trials_number", 10},
        {"use_config_simulation_seed", true},
        {"simulation_seed", 3},
        {"interactive_mode", false},
        {"key_length", 2000},
        {"QBER_begin", 0.01},
        {"QBER_end", 0.05},
        {"QBER_step", 0.01},
        {"pipeline", make_pipeline_json()}};
}

TEST_CASE("Pipeline options are read from JSON", "[config]")
{
    json config = make_pipeline_json();

    SECTION("Optional keys keep their defaults")
    {
        pipeline_config cfg = get_pipeline_config(config);
        REQUIRE(cfg.SAMPLE_FRACTION == Approx(0.2));
        REQUIRE(cfg.QBER_ABORT_THRESHOLD == Approx(0.1));
        REQUIRE(cfg.QBER_CONFIDENCE_Z == Approx(1.96));
        REQUIRE(cfg.INITIAL_BLOCK_SIZE == 16);
        REQUIRE(cfg.MIN_PASSES == 4);
        REQUIRE(cfg.MAX_PASSES == 10);
        REQUIRE(cfg.LEAKAGE_BUDGET == 500);
        REQUIRE(cfg.SECURITY_PARAMETER == 80);
        REQUIRE(cfg.RESIDUAL_ERROR_MARGIN == 0);
        REQUIRE(cfg.PRNG_SEED == 7);
        REQUIRE(cfg.HASH_FAMILY == hash_family::RANDOM_LINEAR);
        REQUIRE(cfg.CHANNEL_TIMEOUT_MS == 5000);
        REQUIRE(cfg.CHANNEL_MAX_RETRIES == 3);
        REQUIRE_FALSE(cfg.TRACE_CASCADE);
    }

    SECTION("Optional keys override the defaults")
    {
        config["min_passes"] = 2;
        config["residual_error_margin"] = 12;
        config["channel_timeout_ms"] = 250;
        config["trace_cascade"] = true;
        pipeline_config cfg = get_pipeline_config(config);
        REQUIRE(cfg.MIN_PASSES == 2);
        REQUIRE(cfg.RESIDUAL_ERROR_MARGIN == 12);
        REQUIRE(cfg.CHANNEL_TIMEOUT_MS == 250);
        REQUIRE(cfg.TRACE_CASCADE);
    }

    SECTION("Missing required keys are reported")
    {
        config.erase("security_parameter");
        REQUIRE_THROWS(get_pipeline_config(config));
    }
}

TEST_CASE("Out-of-range pipeline options are rejected", "[config]")
{
    json config = make_pipeline_json();

    SECTION("Sample fraction")
    {
        config["sample_fraction"] = 1.0;
        REQUIRE_THROWS_AS(get_pipeline_config(config), std::runtime_error);
    }
    SECTION("Abort threshold")
    {
        config["qber_abort_threshold"] = 0.5;
        REQUIRE_THROWS_AS(get_pipeline_config(config), std::runtime_error);
    }
    SECTION("Growth factor")
    {
        config["block_size_growth_factor"] = 0.5;
        REQUIRE_THROWS_AS(get_pipeline_config(config), std::runtime_error);
    }
    SECTION("Pass limits")
    {
        config["min_passes"] = 11;
        REQUIRE_THROWS_AS(get_pipeline_config(config), std::runtime_error);
    }
    SECTION("Hash family")
    {
        config["hash_family"] = "sha256";
        REQUIRE_THROWS_AS(get_pipeline_config(config), std::runtime_error);
    }
}

TEST_CASE("Simulation options are read from JSON", "[config]")
{
    json config = make_config_json();

    config_data cfg = parse_config_data(config);
    REQUIRE(cfg.THREADS_NUMBER == 2);
    REQUIRE(cfg.TRIALS_NUMBER == 10);
    REQUIRE(cfg.SIMULATION_SEED == 3);
    REQUIRE(cfg.KEY_LENGTH == 2000);
    REQUIRE(cfg.PIPELINE.SECURITY_PARAMETER == 80);
    REQUIRE(get_QBER_range(cfg.QBER_BEGIN, cfg.QBER_END, cfg.QBER_STEP).size() == 5);

    SECTION("QBER range must be ordered")
    {
        config["QBER_begin"] = 0.2;
        REQUIRE_THROWS_AS(parse_config_data(config), std::runtime_error);
    }
    SECTION("Key must hold at least two bits")
    {
        config["key_length"] = 1;
        REQUIRE_THROWS_AS(parse_config_data(config), std::runtime_error);
    }
    SECTION("Empty configuration")
    {
        REQUIRE_THROWS_AS(parse_config_data(json::object()), std::runtime_error);
    }
}

TEST_CASE("Configuration files", "[config]")
{
    SECTION("The shipped configuration is valid")
    {
        config_data cfg = get_config_data(fs::path(SOURCE_DIR) / "config.json");
        REQUIRE(cfg.KEY_LENGTH > 0);
        REQUIRE_NOTHROW(validate_pipeline_config(cfg.PIPELINE));
    }

    SECTION("A missing file is reported")
    {
        REQUIRE_THROWS_AS(get_config_data(fs::temp_directory_path() / "qkd_cascade_missing_config.json"), std::runtime_error);
    }

    SECTION("A file is read as a whole")
    {
        fs::path path = fs::temp_directory_path() / "qkd_cascade_test_config.json";
        {
            std::ofstream file(path);
            file << make_config_json().dump(4);
        }
        config_data cfg = get_config_data(path);
        fs::remove(path);
        REQUIRE(cfg.PIPELINE.HASH_FAMILY == hash_family::RANDOM_LINEAR);
    }
}
