#pragma once
#include <cmath>
#include <limits>
#include <string>

#include "types.hpp"

namespace odestep {

// n = floor((x_final - x_initial) / h). The grid stops at x0 + n*h, which
// may fall short of x_final.
inline int iteration_count(double x_initial, double x_final, double h) {
    if(h == 0.0) {
        throw ConfigError("step size h must be non-zero");
    }
    double q = std::floor((x_final - x_initial) / h);
    if(!std::isfinite(q)) {
        throw ConfigError("iteration count is not finite (check x0, xf and h)");
    }
    if(q < 0.0) {
        throw ConfigError("h must have the same sign as (xf - x0): iteration count would be negative");
    }
    if(q > static_cast<double>(std::numeric_limits<int>::max())) {
        throw ConfigError("grid too large: iteration count " + std::to_string(q) + " exceeds the maximum number of steps");
    }
    return static_cast<int>(q);
}

struct StepConfig {
    double x0 = 0.0;
    double y0 = 0.0;
    double h = 1.0;
    int n = 0;

    StepConfig() = default;
    StepConfig(double x0_, double y0_, double h_, int n_) : x0(x0_), y0(y0_), h(h_), n(n_) {
        validate();
    }

    // grid reaching towards xf with step h
    static StepConfig towards(double x0, double y0, double xf, double h) {
        return StepConfig(x0, y0, h, iteration_count(x0, xf, h));
    }

    void validate() const {
        if(h == 0.0 || !std::isfinite(h)) {
            throw ConfigError("step size h must be finite and non-zero");
        }
        if(n < 0) {
            throw ConfigError("iteration count n must be >= 0, got " + std::to_string(n));
        }
    }

    State initial() const { return State{x0, y0}; }
};

}  // namespace odestep
