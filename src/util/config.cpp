#include "config.hpp"

#include "../integrators/registry.hpp"
#include "../io/log.hpp"

namespace odestep::cfg {

static spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if(level == spdlog::level::off && name != "off") {
        throw ConfigError("unknown log_level: " + name);
    }
    return level;
}

static IntegratorCfg parse_integrators(const toml::table* isec) {
    IntegratorCfg icfg;
    if(!isec) {
        return icfg;
    }

    icfg.names = vector_or<std::string>((*isec)["names"].as_array(), icfg.names);

    const toml::table* heun_tbl = as_table_ptr((*isec)["improved_euler"]);
    const std::string slope = value_or<std::string>(heun_tbl, "second_slope", "shifted");
    if(slope == "shifted") {
        icfg.improved_euler.second_slope = ImprovedEulerOptions::SHIFTED;
    }
    else if(slope == "textbook") {
        icfg.improved_euler.second_slope = ImprovedEulerOptions::TEXTBOOK;
    }
    else {
        throw ConfigError("integrators.improved_euler.second_slope must be 'shifted' or 'textbook', got '" + slope + "'");
    }

    // unknown or duplicated (after alias resolution) names
    make_integrators(icfg);

    return icfg;
}

GeneralConfig from_table(const toml::table& root) {
    GeneralConfig config;

    config.log_level = parse_log_level(value_or<std::string>(root, "log_level", "info"));
    config.log_pattern = value_or<std::string>(root, "log_pattern", config.log_pattern);

    // initial condition and grid
    const toml::table* init_tbl = as_table_ptr(root["initial"]);
    if(!init_tbl) {
        ODESTEP_CRITICAL("[initial] section missing");
        throw ConfigError("[initial] section missing");
    }
    config.initial.x0 = *value_or_die<double>(init_tbl, "x0");
    config.initial.y0 = *value_or_die<double>(init_tbl, "y0");

    const toml::table* grid_tbl = as_table_ptr(root["grid"]);
    if(!grid_tbl) {
        ODESTEP_CRITICAL("[grid] section missing");
        throw ConfigError("[grid] section missing");
    }
    config.grid.xf = *value_or_die<double>(grid_tbl, "xf");
    config.grid.h = *value_or_die<double>(grid_tbl, "h");
    // fail early on a malformed grid
    config.step_config();

    // model
    const toml::table* model_tbl = as_table_ptr(root["model"]);
    if(!model_tbl) {
        ODESTEP_CRITICAL("[model] section missing");
        throw ConfigError("[model] section missing");
    }
    config.problem = make_problem(parse_model_any(*model_tbl), config.initial.x0, config.initial.y0);

    config.integrator = parse_integrators(as_table_ptr(root["integrators"]));

    // output
    if(const toml::table* o = as_table_ptr(root["output"])) {
        config.out.digits = value_or<int>(o, "digits", config.out.digits);
        config.out.trajectory_file = value_or<std::string>(o, "trajectory_file", config.out.trajectory_file);
        config.out.convergence_file = value_or<std::string>(o, "convergence_file", config.out.convergence_file);
        if(config.out.digits < 0 || config.out.digits > 17) {
            throw ConfigError(fmt::format("output.digits must be between 0 and 17, got {}", config.out.digits));
        }
    }

    // convergence study
    if(const toml::table* c = as_table_ptr(root["convergence"])) {
        config.convergence.h = vector_or<double>(c->operator[]("h").as_array(), {});
        for(double h : config.convergence.h) {
            iteration_count(config.initial.x0, config.grid.xf, h);
        }
        if(config.convergence.enabled() && !config.problem.has_solution()) {
            throw ConfigError("a convergence study needs a model with a closed-form solution, '" + config.problem.model + "' has none");
        }
    }

    return config;
}

GeneralConfig load(const std::string& path) {
    auto result = toml::parse_file(path);
    if(!result) {
        throw ConfigError(fmt::format("Parsing '{}' failed with error '{}'", path, result.error().description()));
    }
    return from_table(result.table());
}

GeneralConfig load_string(std::string_view doc) {
    auto result = toml::parse(doc);
    if(!result) {
        throw ConfigError(fmt::format("Parsing failed with error '{}'", result.error().description()));
    }
    return from_table(result.table());
}

}  // namespace odestep::cfg
