#pragma once

#include <odestep/core/step_config.hpp>
#include <odestep/integrators/improved_euler.hpp>

#include "../physics/problem.hpp"
#include "toml.hpp"

#include <string>
#include <vector>

namespace odestep::cfg {

// ---------- user-facing config structs ----------
struct InitialCfg {
    double x0 = 0.0;
    double y0 = 0.0;
};

struct GridCfg {
    double xf = 1.0;
    double h = 0.1;
};

struct IntegratorCfg {
    std::vector<std::string> names{"euler", "improved_euler", "rk4"};
    ImprovedEulerOptions improved_euler{};
};

struct OutputCfg {
    int digits = 6;
    std::string trajectory_file = "trajectories.dat";
    std::string convergence_file;
};

struct ConvergenceCfg {
    std::vector<double> h;

    bool enabled() const { return !h.empty(); }
};

struct GeneralConfig {
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::string log_pattern = odestep::log::default_pattern;
    InitialCfg initial{};
    GridCfg grid{};
    Problem problem{};
    IntegratorCfg integrator{};
    OutputCfg out{};
    ConvergenceCfg convergence{};

    StepConfig step_config() const {
        return StepConfig::towards(initial.x0, initial.y0, grid.xf, grid.h);
    }
};

GeneralConfig from_table(const toml::table& root);
GeneralConfig load(const std::string& path);
GeneralConfig load_string(std::string_view doc);

}  // namespace odestep::cfg
