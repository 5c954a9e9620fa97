#pragma once
#include "integrator.hpp"

namespace odestep {

struct Euler : public IIntegrator {
    State step(const State& s, double h, const DerivativeFn& f) const override {
        const double x1 = s.x + h;
        return State{x1, s.y + h * f(x1, s.y)};
    }

    std::string name() const override { return "euler"; }
    int order() const override { return 1; }
};

}  // namespace odestep
