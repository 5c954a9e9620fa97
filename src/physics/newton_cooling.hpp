#pragma once
#include <cmath>

#include "../util/toml.hpp"

namespace odestep {

// y' = -k (y - ambient)
struct NewtonCooling {
    static constexpr const char* name = "newton_cooling";
    static constexpr bool closed_form = true;

    double ambient;
    double k;

    NewtonCooling(double ambient_, double k_) : ambient(ambient_), k(k_) {}

    // either `k` directly, or two (t, y) observations from which k is deduced
    explicit NewtonCooling(const toml::table& tbl) {
        ambient = *value_or_die<double>(tbl, "ambient");

        auto obs = matrix_or<double>(tbl["observations"].as_array(), {});
        if(tbl.contains("k")) {
            if(!obs.empty()) {
                throw ConfigError("newton_cooling: give either 'k' or 'observations', not both");
            }
            k = *value_or_die<double>(tbl, "k");
        }
        else {
            if(obs.size() != 2 || obs[0].size() != 2 || obs[1].size() != 2) {
                throw ConfigError("newton_cooling: 'observations' must hold exactly two [t, y] pairs");
            }
            k = rate_from_observations(ambient, obs[0][0], obs[0][1], obs[1][0], obs[1][1]);
            ODESTEP_INFO("newton_cooling: k = {} deduced from ({}, {}) and ({}, {})", k, obs[0][0], obs[0][1], obs[1][0], obs[1][1]);
        }
    }

    // Two readings of the same body fix k = -ln((y2 - ambient) / (y1 - ambient)) / (t2 - t1)
    static double rate_from_observations(double ambient, double t1, double y1, double t2, double y2) {
        if(t2 == t1) {
            throw ConfigError("newton_cooling: observations must be taken at different times");
        }
        const double ratio = (y2 - ambient) / (y1 - ambient);
        if(!(ratio > 0.0) || !std::isfinite(ratio)) {
            throw ConfigError("newton_cooling: both observations must lie on the same side of the ambient value");
        }
        return -std::log(ratio) / (t2 - t1);
    }

    inline double dydx(double /*x*/, double y) const {
        return -k * (y - ambient);
    }

    inline double exact(double x, double x0, double y0) const {
        return ambient + (y0 - ambient) * std::exp(-k * (x - x0));
    }
};

}  // namespace odestep
