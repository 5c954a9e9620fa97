#include <iostream>

#include "core/simulation.hpp"
#include "integrators/registry.hpp"
#include "io/log.hpp"
#include "io/plain.hpp"
#include "io/report.hpp"
#include "util/config.hpp"

using namespace odestep;

int main(int argc, char *argv[]) {
    if(argc < 2) {
        std::cerr << fmt::format("Usage is {} configuration_file", argv[0]) << std::endl;
        return 0;
    }

    odestep::log::init_and_get();

    try {
        odestep::cfg::GeneralConfig config = odestep::cfg::load(argv[1]);
        odestep::log::configure(config.log_level, config.log_pattern);

        ODESTEP_INFO("Integrating model '{}' from x0 = {} (y0 = {}) towards xf = {}", config.problem.model, config.initial.x0, config.initial.y0, config.grid.xf);

        auto steppers = make_integrators(config.integrator);
        auto grid = config.step_config();
        if(grid.x0 + grid.n * grid.h != config.grid.xf) {
            ODESTEP_WARN("xf = {} is not a multiple of h = {} away from x0, the grid stops after {} steps", config.grid.xf, grid.h, grid.n);
        }

        auto res = run_comparison(config.problem, grid, config.grid.xf, steppers);
        std::cout << odestep::io::format_report(res, config.out.digits) << std::endl;

        if(!config.out.trajectory_file.empty()) {
            odestep::io::write_trajectories_plain(res, config.problem.model, config.out.trajectory_file);
            ODESTEP_INFO("Trajectories written to '{}'", config.out.trajectory_file);
        }

        if(config.convergence.enabled()) {
            auto table = convergence_study(config.problem, config.initial.x0, config.initial.y0, config.grid.xf, config.convergence.h, steppers);
            std::cout << odestep::io::format_convergence(table) << std::endl;
            if(!config.out.convergence_file.empty()) {
                odestep::io::write_convergence_plain(table, config.out.convergence_file);
                ODESTEP_INFO("Convergence table written to '{}'", config.out.convergence_file);
            }
        }

        ODESTEP_INFO("END OF SIMULATION");
    }
    catch (const std::runtime_error &e) {
        if(std::string(e.what()).length() > 0) {
            ODESTEP_CRITICAL(e.what());
        }
        return 1;
    }
    return 0;
}
