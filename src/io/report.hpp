#pragma once
#include <algorithm>
#include <string>

#include "../core/simulation.hpp"
#include "log.hpp"

namespace odestep::io {

// Console summary of a comparison run. Values are rounded to `digits`
// decimals; errors are printed in full.
inline std::string format_report(const ComparisonResult& res, int digits) {
    std::string out = fmt::format("\nSIMULATION {{n: {}; h: {}}}\n\n", res.grid.n, res.grid.h);
    out += fmt::format("Results for y({}):\n", res.x_target);

    size_t width = 0;
    for(const auto& m : res.methods) width = std::max(width, m.method.size());

    for(const auto& m : res.methods) {
        const State& last = m.trajectory.back();
        out += fmt::format("  {:<{}} (order {}): ({:.{}f}; {:.{}f})", m.method, width, m.order, last.x, digits, last.y, digits);
        if(res.report) {
            const ErrorEntry& e = res.report->at(m.method);
            out += fmt::format(". Error at x = {:.{}f}: {}. Error vs y({}): {}", last.x, digits, e.abs_error, res.x_target, e.target_error);
        }
        out += "\n";
    }

    if(res.report) {
        out += fmt::format("Solution: y({}) = {:.{}f}\n", res.x_target, res.report->reference_at_target(), digits);
    }
    else {
        out += "Solution: no closed form available\n";
    }
    return out;
}

inline std::string format_convergence(const ConvergenceTable& table) {
    std::string out = fmt::format("\n{:>12} {:>8} {:>12}", "h", "n", "x_final");
    for(const auto& m : table.methods) {
        out += fmt::format(" {:>22}", m);
    }
    out += "\n";
    for(const auto& row : table.rows) {
        out += fmt::format("{:>12g} {:>8} {:>12g}", row.h, row.n, row.x_final);
        for(double e : row.errors) {
            out += fmt::format(" {:>22.15e}", e);
        }
        out += "\n";
    }
    return out;
}

}  // namespace odestep::io
