#pragma once
#include <cmath>

#include "../util/toml.hpp"

namespace odestep {

// y' = r y (1 - y / capacity)
struct Logistic {
    static constexpr const char* name = "logistic";
    static constexpr bool closed_form = true;

    double r;
    double capacity;

    Logistic(double r_, double capacity_) : r(r_), capacity(capacity_) {}
    explicit Logistic(const toml::table& tbl) {
        r = *value_or_die<double>(tbl, "r");
        capacity = *value_or_die<double>(tbl, "capacity");
        if(capacity == 0.0) {
            throw ConfigError("logistic: 'capacity' must be non-zero");
        }
    }

    inline double dydx(double /*x*/, double y) const {
        return r * y * (1.0 - y / capacity);
    }

    inline double exact(double x, double x0, double y0) const {
        if(y0 == 0.0) {
            return 0.0;
        }
        return capacity / (1.0 + (capacity / y0 - 1.0) * std::exp(-r * (x - x0)));
    }
};

}  // namespace odestep
