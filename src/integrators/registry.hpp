#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <odestep/integrators/euler.hpp>
#include <odestep/integrators/improved_euler.hpp>
#include <odestep/integrators/rk4.hpp>

#include "../util/config.hpp"

namespace odestep {

using IntegratorFactory = std::function<std::unique_ptr<IIntegrator>(const cfg::IntegratorCfg&)>;

inline std::unordered_map<std::string, IntegratorFactory> make_integrator_registry() {
    std::unordered_map<std::string, IntegratorFactory> R;

    R["euler"] = [](const cfg::IntegratorCfg&) {
        return std::make_unique<Euler>();
    };

    R["improved_euler"] = [](const cfg::IntegratorCfg& icfg) {
        return std::make_unique<ImprovedEuler>(icfg.improved_euler);
    };
    R["heun"] = R["improved_euler"];

    R["rk4"] = [](const cfg::IntegratorCfg&) {
        return std::make_unique<RK4>();
    };

    return R;
}

// one stepper per configured name, in the configured order
inline std::vector<std::unique_ptr<IIntegrator>> make_integrators(const cfg::IntegratorCfg& icfg) {
    auto registry = make_integrator_registry();
    std::vector<std::unique_ptr<IIntegrator>> out;
    out.reserve(icfg.names.size());
    for(const auto& name : icfg.names) {
        auto it = registry.find(name);
        if(it == registry.end()) {
            throw ConfigError("unknown integrator: " + name);
        }
        auto stepper = it->second(icfg);
        // aliases resolve to the same stepper
        for(const auto& prev : out) {
            if(prev->name() == stepper->name()) {
                throw ConfigError("integrator listed twice: " + name + " (" + stepper->name() + ")");
            }
        }
        out.push_back(std::move(stepper));
    }
    return out;
}

}  // namespace odestep
