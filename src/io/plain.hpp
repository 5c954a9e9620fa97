#pragma once
#include <fstream>
#include <iomanip>
#include <string>

#include "../core/simulation.hpp"
#include "log.hpp"

namespace odestep::io {

// Write all trajectories of a run to a plain-text file.
// Header format:
//   # model = NAME, n = N, h = H, columns = x m1 m2 ... [reference]
// Data:
//   n+1 lines, one per grid point
inline void write_trajectories_plain(const ComparisonResult& res, const std::string& model,
                                     const std::string& filename) {
    std::ofstream os(filename, std::ios::out | std::ios::trunc);
    if(!os) {
        ODESTEP_CRITICAL("Cannot open {} for writing", filename);
        throw std::runtime_error("cannot open " + filename + " for writing");
    }

    std::string columns = "x";
    for(const auto& m : res.methods) columns += " " + m.method;
    if(res.reference) columns += " reference";

    os << fmt::format("# model = {}, n = {}, h = {}, columns = {}", model, res.grid.n, res.grid.h, columns) << std::endl;

    os << std::setprecision(16);
    const size_t rows = res.methods.front().trajectory.size();
    for(size_t i = 0; i < rows; ++i) {
        os << res.methods.front().trajectory[i].x;
        for(const auto& m : res.methods) {
            os << " " << m.trajectory[i].y;
        }
        if(res.reference) {
            os << " " << (*res.reference)[i].y;
        }
        os << std::endl;
    }
}

// Header: "# columns = h n x_final m1 m2 ...", then one line per step size
inline void write_convergence_plain(const ConvergenceTable& table, const std::string& filename) {
    std::ofstream os(filename, std::ios::out | std::ios::trunc);
    if(!os) {
        ODESTEP_CRITICAL("Cannot open {} for writing", filename);
        throw std::runtime_error("cannot open " + filename + " for writing");
    }

    std::string columns = "h n x_final";
    for(const auto& m : table.methods) columns += " " + m;
    os << "# columns = " << columns << std::endl;

    os << std::setprecision(16);
    for(const auto& row : table.rows) {
        os << row.h << " " << row.n << " " << row.x_final;
        for(double e : row.errors) os << " " << e;
        os << std::endl;
    }
}

}  // namespace odestep::io
