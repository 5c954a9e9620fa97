#pragma once
#include <string>
#include <vector>

#include "../core/step_config.hpp"
#include "../core/types.hpp"

namespace odestep {

// A fixed-step method. step() is a pure map state_i -> state_{i+1}; all
// methods advance x first and evaluate their first slope at the new x.
struct IIntegrator {
    virtual ~IIntegrator() = default;
    virtual State step(const State& s, double h, const DerivativeFn& f) const = 0;
    virtual std::string name() const = 0;
    virtual int order() const = 0;
};

// Applies stepper.step() cfg.n times starting from (x0, y0) and collects
// every state. Exceptions thrown by f are not caught.
inline Trajectory integrate(const IIntegrator& stepper, const StepConfig& cfg, const DerivativeFn& f) {
    cfg.validate();
    if(!f) {
        throw ConfigError("no derivative function given to '" + stepper.name() + "'");
    }

    std::vector<State> samples;
    samples.reserve(static_cast<size_t>(cfg.n) + 1);

    State s = cfg.initial();
    samples.push_back(s);
    for(int i = 0; i < cfg.n; i++) {
        s = stepper.step(s, cfg.h, f);
        samples.push_back(s);
    }
    return Trajectory(std::move(samples));
}

}  // namespace odestep
