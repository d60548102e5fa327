#include <cstdlib>

#include "config.hpp"
#include "simulation.hpp"

const fs::path CONFIG_PATH = fs::path(SOURCE_DIR) / "config.json";
const fs::path RESULTS_DIR_PATH = fs::path(SOURCE_DIR) / "results";

int main()
{
    try
    {
        config_data cfg = get_config_data(CONFIG_PATH);
        if (cfg.INTERACTIVE_MODE)
        {
            fmt::print(fg(fmt::color::purple), "INTERACTIVE MODE\n");
            QKD_cascade_interactive_simulation(cfg);
        }
        else
        {
            fmt::print(fg(fmt::color::purple), "BATCH MODE\n");
            std::vector<sim_result> sim_results = QKD_cascade_batch_simulation(cfg);

            fmt::print(fg(fmt::color::green), "The results will be written to the directory: {}\n", RESULTS_DIR_PATH.string());
            write_file(sim_results, RESULTS_DIR_PATH, cfg);
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, fg(fmt::color::red), "ERROR: {}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
