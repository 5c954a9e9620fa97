#pragma once
#include <string>
#include <type_traits>
#include <variant>

#include "exponential.hpp"
#include "logistic.hpp"
#include "newton_cooling.hpp"
#include "riccati.hpp"

namespace odestep {

// What the engine integrates: f(x, y) plus, when known, the closed form
// matching the initial condition.
struct Problem {
    std::string model;
    DerivativeFn derivative;
    SolutionFn solution;

    bool has_solution() const { return static_cast<bool>(solution); }
};

using ModelAny = std::variant<
    NewtonCooling,
    Exponential,
    Logistic,
    Riccati
>;

inline ModelAny parse_model_any(const toml::table& model_tbl) {
    const std::string type = *value_or_die<std::string>(model_tbl, "type");
    if(type == "newton_cooling") {
        return NewtonCooling(model_tbl);
    }
    else if(type == "exponential") {
        return Exponential(model_tbl);
    }
    else if(type == "logistic") {
        return Logistic(model_tbl);
    }
    else if(type == "riccati") {
        return Riccati(model_tbl);
    }
    throw ConfigError("unknown model.type: " + type);
}

template <class M>
Problem make_problem(const M& model, double x0, double y0) {
    Problem p;
    p.model = M::name;
    p.derivative = [model](double x, double y) { return model.dydx(x, y); };
    if constexpr (M::closed_form) {
        p.solution = [model, x0, y0](double x) { return model.exact(x, x0, y0); };
    }
    return p;
}

inline Problem make_problem(const ModelAny& model, double x0, double y0) {
    return std::visit([&](auto&& m) { return make_problem(m, x0, y0); }, model);
}

}  // namespace odestep
