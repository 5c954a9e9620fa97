#pragma once
#include "integrator.hpp"

namespace odestep {

// Classical four-stage Runge-Kutta. Stage times are taken from the advanced
// x, like the other two methods.
struct RK4 : public IIntegrator {
    State step(const State& s, double h, const DerivativeFn& f) const override {
        const double x1 = s.x + h;
        const double half = 0.5 * h;

        const double k1 = f(x1, s.y);
        const double k2 = f(x1 + half, s.y + half * k1);
        const double k3 = f(x1 + half, s.y + half * k2);
        const double k4 = f(x1 + h, s.y + h * k3);

        return State{x1, s.y + (h / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4)};
    }

    std::string name() const override { return "rk4"; }
    int order() const override { return 4; }
};

}  // namespace odestep
