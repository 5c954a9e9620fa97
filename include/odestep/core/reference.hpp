#pragma once
#include "step_config.hpp"
#include "types.hpp"

namespace odestep {

// Evaluates the closed form on the same grid the steppers walk. Sample 0 is
// the given initial condition, not solution(x0).
inline Trajectory sample_reference(const StepConfig& cfg, const SolutionFn& solution) {
    cfg.validate();
    if(!solution) {
        throw ConfigError("no closed-form solution to sample");
    }

    std::vector<State> samples;
    samples.reserve(static_cast<size_t>(cfg.n) + 1);

    State s = cfg.initial();
    samples.push_back(s);
    for(int i = 0; i < cfg.n; i++) {
        s.x = s.x + cfg.h;
        s.y = solution(s.x);
        samples.push_back(s);
    }
    return Trajectory(std::move(samples));
}

}  // namespace odestep
