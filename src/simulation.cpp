#include "simulation.hpp"
#include "bit_array_operations.hpp"

#include <cmath>
#include <random>
#include <limits>
#include <fstream>

// Records the results of the simulation in a ".csv" format file
void write_file(const std::vector<sim_result> &data, const fs::path &directory, const config_data &cfg)
{
    try
    {
        if (!fs::exists(directory))
        {
            fs::create_directories(directory);
        }
        fs::path result_file_path = get_results_file_path(directory, cfg.TRIALS_NUMBER, cfg.KEY_LENGTH, cfg.SIMULATION_SEED);

        std::fstream fout;
        fout.open(result_file_path, std::ios::out | std::ios::trunc);
        if (!fout.is_open())
        {
            throw std::runtime_error("Failed to open " + result_file_path.string());
        }
        fout << "№;QBER;ACTUAL_QBER;RATIO_TRIALS_SUCCESSFUL;RATIO_TRIALS_KEYS_MATCH;MEAN_ESTIMATED_QBER;MEAN_PASSES;MEAN_LEAKAGE;"
                "MEAN_FINAL_LENGTH;STD_DEV_FINAL_LENGTH;ABORTS_CHANNEL_TOO_NOISY;ABORTS_RECONCILIATION_FAILED;"
                "ABORTS_INSUFFICIENT_KEY_MATERIAL;ABORTS_CHANNEL_DISCONNECTED\n";
        for (size_t i = 0; i < data.size(); i++)
        {
            fout << data[i].sim_number << ";" << data[i].QBER << ";" << data[i].actual_QBER << ";" << data[i].ratio_trials_successful
                 << ";" << data[i].ratio_trials_keys_match << ";" << data[i].mean_estimated_QBER << ";" << data[i].mean_passes
                 << ";" << data[i].mean_leakage << ";" << data[i].mean_final_length << ";" << data[i].std_dev_final_length
                 << ";" << data[i].aborts_channel_too_noisy << ";" << data[i].aborts_reconciliation_failed
                 << ";" << data[i].aborts_insufficient_key_material << ";" << data[i].aborts_channel_disconnected << "\n";
        }
        fout.close();
    }
    catch (const std::exception &ex)
    {
        fmt::print(stderr, fg(fmt::color::red), "An error occurred while writing to the file.\n");
        throw;
    }
}

// Runs a single session on a random key of the given length with exactly floor(key_length * QBER) errors.
trial_result run_trial(size_t key_length, double QBER, size_t seed, const pipeline_config &cfg)
{
    std::mt19937 prng(seed);

    trial_result result;
    raw_key_pair keys;
    keys.alice = generate_random_bit_array(prng, key_length);
    result.actual_QBER = introduce_errors(prng, keys.alice, QBER, keys.bob);

    pipeline_config session_cfg = cfg;
    session_cfg.PRNG_SEED = seed;
    try
    {
        std::vector<int> reference_key;
        final_key key = run_qkd_session(std::move(keys), session_cfg, &reference_key);
        result.success = true;
        result.keys_match = arrays_equal(key.bits(), reference_key);
        result.diagnostics = key.diagnostics();
    }
    catch (const qkd_failure &e)
    {
        result.success = false;
        result.reason = e.reason();
    }
    return result;
}

sim_result summarize_trials(size_t sim_number, double QBER, const std::vector<trial_result> &trial_results)
{
    sim_result result;
    result.sim_number = sim_number;
    result.QBER = QBER;
    if (trial_results.empty())
    {
        return result;
    }
    result.actual_QBER = trial_results[0].actual_QBER;

    size_t trials_successful = 0;
    size_t trials_keys_match = 0;
    for (const trial_result &trial : trial_results)
    {
        if (!trial.success)
        {
            switch (trial.reason)
            {
            case failure_reason::CHANNEL_TOO_NOISY:
                result.aborts_channel_too_noisy++;
                break;
            case failure_reason::RECONCILIATION_FAILED:
                result.aborts_reconciliation_failed++;
                break;
            case failure_reason::INSUFFICIENT_KEY_MATERIAL:
                result.aborts_insufficient_key_material++;
                break;
            case failure_reason::CHANNEL_DISCONNECTED:
            case failure_reason::TIMEOUT:
                result.aborts_channel_disconnected++;
                break;
            }
            continue;
        }

        trials_successful++;
        trials_keys_match += static_cast<size_t>(trial.keys_match);
        result.mean_estimated_QBER += trial.diagnostics.estimated_qber;
        result.mean_passes += static_cast<double>(trial.diagnostics.passes);
        result.mean_leakage += static_cast<double>(trial.diagnostics.leakage);
        result.mean_final_length += static_cast<double>(trial.diagnostics.final_length);
    }

    result.ratio_trials_successful = static_cast<double>(trials_successful) / trial_results.size();
    result.ratio_trials_keys_match = static_cast<double>(trials_keys_match) / trial_results.size();
    if (trials_successful == 0)
    {
        return result;
    }

    result.mean_estimated_QBER /= trials_successful;
    result.mean_passes /= trials_successful;
    result.mean_leakage /= trials_successful;
    result.mean_final_length /= trials_successful;

    double sum_of_squares = 0.;
    for (const trial_result &trial : trial_results)
    {
        if (trial.success)
        {
            double deviation = static_cast<double>(trial.diagnostics.final_length) - result.mean_final_length;
            sum_of_squares += deviation * deviation;
        }
    }
    result.std_dev_final_length = std::sqrt(sum_of_squares / trials_successful);
    return result;
}

// Runs one session per QBER value and prints every stage.
void QKD_cascade_interactive_simulation(const config_data &cfg)
{
    std::vector<double> QBER = get_QBER_range(cfg.QBER_BEGIN, cfg.QBER_END, cfg.QBER_STEP);
    std::mt19937 prng(cfg.SIMULATION_SEED);

    pipeline_config session_cfg = cfg.PIPELINE;
    session_cfg.TRACE_QBER_SAMPLER = true;
    session_cfg.TRACE_CASCADE = true;
    session_cfg.TRACE_PRIVACY_AMPLIFICATION = true;

    for (size_t i = 0; i < QBER.size(); i++)
    {
        fmt::print(fg(fmt::color::green), "№:{}\n", i + 1);

        raw_key_pair keys;
        keys.alice = generate_random_bit_array(prng, cfg.KEY_LENGTH);
        double actual_QBER = introduce_errors(prng, keys.alice, QBER[i], keys.bob);
        fmt::print(fg(fmt::color::green), "Actual QBER: {}\n", actual_QBER);
        fmt::print(fg(fmt::color::green), "Number of errors in a key: {}\n", count_mismatches(keys.alice, keys.bob));

        session_cfg.PRNG_SEED = prng();
        try
        {
            std::vector<int> reference_key;
            final_key key = run_qkd_session(std::move(keys), session_cfg, &reference_key);
            const session_diagnostics &diagnostics = key.diagnostics();
            fmt::print(fg(fmt::color::green), "Estimated QBER: {:.4f} +/- {:.4f}\n", diagnostics.estimated_qber, diagnostics.qber_confidence_margin);
            fmt::print(fg(fmt::color::green), "Passes performed: {}, bits corrected: {}, leakage: {}\n", diagnostics.passes,
                       diagnostics.bit_flips, diagnostics.leakage);
            fmt::print(fg(fmt::color::green), "Final key: {} of {} reconciled bits\n", key.length(), diagnostics.reconciled_length);
            print_array(key.bits(), 64);
            fmt::print(fg(fmt::color::green), "{}\n\n", (arrays_equal(key.bits(), reference_key) ? "Final keys MATCH" : "Final keys DIFFER"));
        }
        catch (const qkd_failure &e)
        {
            fmt::print(fg(fmt::color::red), "Session FAILED: {}\n\n", e.what());
        }
    }
}

// Distributes the trials of every QBER value across the CPU threads and runs them.
std::vector<sim_result> QKD_cascade_batch_simulation(const config_data &cfg)
{
    using namespace indicators;
    std::vector<double> QBER = get_QBER_range(cfg.QBER_BEGIN, cfg.QBER_END, cfg.QBER_STEP);

    size_t trials_total = QBER.size() * cfg.TRIALS_NUMBER;
    indicators::show_console_cursor(false);
    indicators::ProgressBar bar{
        option::BarWidth{50},
        option::Start{" ["},
        option::Fill{"="},
        option::Lead{">"},
        option::Remainder{"-"},
        option::End{"]"},
        option::PrefixText{"PROGRESS"},
        option::ForegroundColor{Color::green},
        option::ShowElapsedTime{true},
        option::ShowRemainingTime{true},
        option::FontStyles{std::vector<FontStyle>{FontStyle::bold}},
        option::MaxProgress{trials_total}};

    size_t iteration = 0;
    std::vector<sim_result> sim_results(QBER.size());
    std::vector<trial_result> trial_results(cfg.TRIALS_NUMBER);
    std::vector<size_t> trial_seeds(cfg.TRIALS_NUMBER);

    std::mt19937 prng(cfg.SIMULATION_SEED);
    std::uniform_int_distribution<size_t> distribution(0, std::numeric_limits<size_t>::max());

    BS::thread_pool pool(cfg.THREADS_NUMBER);
    for (size_t i = 0; i < QBER.size(); i++)
    {
        iteration += cfg.TRIALS_NUMBER;
        bar.set_option(option::PostfixText{
            std::to_string(iteration) + "/" + std::to_string(trials_total)});

        for (size_t k = 0; k < trial_seeds.size(); k++)
        {
            trial_seeds[k] = distribution(prng);
        }

        double current_QBER = QBER[i];
        BS::multi_future<void> trials = pool.submit_loop<size_t>(0, cfg.TRIALS_NUMBER,
                                                                 [&cfg, current_QBER, &trial_results, &trial_seeds, &bar](size_t k)
                                                                 {
                                                                     trial_results[k] = run_trial(cfg.KEY_LENGTH, current_QBER, trial_seeds[k], cfg.PIPELINE);
                                                                     bar.tick(); // For correct time estimation
                                                                 });
        trials.wait();
        trials.get();

        sim_results[i] = summarize_trials(i, current_QBER, trial_results);
    }
    indicators::show_console_cursor(true);
    return sim_results;
}
