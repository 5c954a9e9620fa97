#pragma once
#include <cmath>

#include "../util/toml.hpp"

namespace odestep {

// y' = rate * y
struct Exponential {
    static constexpr const char* name = "exponential";
    static constexpr bool closed_form = true;

    double rate;

    explicit Exponential(double rate_) : rate(rate_) {}
    explicit Exponential(const toml::table& tbl) {
        rate = *value_or_die<double>(tbl, "rate");
    }

    inline double dydx(double /*x*/, double y) const { return rate * y; }

    inline double exact(double x, double x0, double y0) const {
        return y0 * std::exp(rate * (x - x0));
    }
};

}  // namespace odestep
