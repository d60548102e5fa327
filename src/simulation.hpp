#pragma once
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/color.h>
#include <BS_thread_pool.hpp>
#include <indicators/progress_bar.hpp>
#include <indicators/cursor_control.hpp>

#include "utils.hpp"
#include "config.hpp"
#include "pipeline.hpp"
#include "qkd_error.hpp"

struct trial_result
{
    bool success{};
    failure_reason reason{};
    bool keys_match{};           // Both parties ended with the same final key.
    double actual_QBER{};        // Rate of errors actually injected into Bob's key.
    session_diagnostics diagnostics{};
};

struct sim_result
{
    size_t sim_number{};
    double QBER{};
    double actual_QBER{};                  // An accurate QBER that corresponds to the number of errors in the key.
    double ratio_trials_successful{};      // Sessions that released a final key.
    double ratio_trials_keys_match{};      // Sessions whose final keys are identical on both sides.
    double mean_estimated_QBER{};          // Over successful sessions.
    double mean_passes{};                  // Over successful sessions.
    double mean_leakage{};                 // Over successful sessions.
    double mean_final_length{};            // Over successful sessions.
    double std_dev_final_length{};
    size_t aborts_channel_too_noisy{};
    size_t aborts_reconciliation_failed{};
    size_t aborts_insufficient_key_material{};
    size_t aborts_channel_disconnected{};
};

void write_file(const std::vector<sim_result> &data, const fs::path &directory, const config_data &cfg);
trial_result run_trial(size_t key_length, double QBER, size_t seed, const pipeline_config &cfg);
sim_result summarize_trials(size_t sim_number, double QBER, const std::vector<trial_result> &trial_results);
void QKD_cascade_interactive_simulation(const config_data &cfg);
std::vector<sim_result> QKD_cascade_batch_simulation(const config_data &cfg);
