#pragma once
#include "integrator.hpp"

namespace odestep {

struct ImprovedEulerOptions {
    enum SecondSlope {
        // f(x1 + h, y_aux), as the reference program does
        SHIFTED,
        // f(x1, y_aux)
        TEXTBOOK
    };
    SecondSlope second_slope = SHIFTED;
};

// Heun's predictor-corrector: an Euler predictor followed by the average of
// two slopes.
struct ImprovedEuler : public IIntegrator {
    ImprovedEulerOptions opt;

    ImprovedEuler() = default;
    explicit ImprovedEuler(ImprovedEulerOptions o) : opt(o) {}

    State step(const State& s, double h, const DerivativeFn& f) const override {
        const double x1 = s.x + h;

        const double s1 = f(x1, s.y);
        const double y_aux = s.y + h * s1;

        const double x2 = (opt.second_slope == ImprovedEulerOptions::SHIFTED) ? x1 + h : x1;
        const double s2 = f(x2, y_aux);

        return State{x1, s.y + 0.5 * h * (s1 + s2)};
    }

    std::string name() const override { return "improved_euler"; }
    int order() const override { return 2; }
};

}  // namespace odestep
