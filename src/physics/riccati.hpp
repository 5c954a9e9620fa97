#pragma once
#include "../util/toml.hpp"

namespace odestep {

// y' = x^2 + y^2. No elementary closed form, so runs with this model skip
// the error report.
struct Riccati {
    static constexpr const char* name = "riccati";
    static constexpr bool closed_form = false;

    Riccati() = default;
    explicit Riccati(const toml::table& /*tbl*/) {}

    inline double dydx(double x, double y) const {
        return x * x + y * y;
    }
};

}  // namespace odestep
