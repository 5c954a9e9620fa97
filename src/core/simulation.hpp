#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <odestep/core/comparison.hpp>
#include <odestep/core/reference.hpp>
#include <odestep/core/step_config.hpp>
#include <odestep/integrators/integrator.hpp>

#include "../physics/problem.hpp"

namespace odestep {

using IntegratorList = std::vector<std::unique_ptr<IIntegrator>>;

struct ComparisonResult {
    StepConfig grid;
    double x_target = 0.0;
    std::vector<MethodResult> methods;
    // present only when the problem has a closed form
    std::optional<Trajectory> reference;
    std::optional<ErrorReport> report;
};

// Runs every stepper on the grid x0 -> xf with step h, then samples the
// reference and builds the error report once all trajectories exist.
ComparisonResult run_comparison(const Problem& problem, const StepConfig& grid, double x_target,
                                const IntegratorList& steppers);

struct ConvergenceRow {
    double h = 0.0;
    int n = 0;
    double x_final = 0.0;
    // abs_error per method, same order as ConvergenceTable::methods
    std::vector<double> errors;
};

struct ConvergenceTable {
    std::vector<std::string> methods;
    std::vector<ConvergenceRow> rows;

    double error(size_t row, const std::string& method) const;
};

ConvergenceTable convergence_study(const Problem& problem, double x0, double y0, double xf,
                                   const std::vector<double>& h_values, const IntegratorList& steppers);

}  // namespace odestep
