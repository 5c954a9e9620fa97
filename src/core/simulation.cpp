#include "simulation.hpp"

#include "../io/log.hpp"

#include <algorithm>

namespace odestep {

ComparisonResult run_comparison(const Problem& problem, const StepConfig& grid, double x_target,
                                const IntegratorList& steppers) {
    grid.validate();
    if(steppers.empty()) {
        throw ConfigError("no integrators selected");
    }

    ComparisonResult res;
    res.grid = grid;
    res.x_target = x_target;

    ODESTEP_DEBUG("model '{}': n = {}, h = {}, x0 = {}, y0 = {}", problem.model, grid.n, grid.h, grid.x0, grid.y0);

    for(const auto& stepper : steppers) {
        MethodResult r;
        r.method = stepper->name();
        r.order = stepper->order();
        r.trajectory = integrate(*stepper, grid, problem.derivative);
        ODESTEP_DEBUG("{}: y({}) = {}", r.method, r.trajectory.back().x, r.trajectory.back().y);
        res.methods.push_back(std::move(r));
    }

    if(problem.has_solution()) {
        res.reference = sample_reference(grid, problem.solution);
        res.report = Comparator::compare(res.methods, problem.solution, x_target);
    }
    else {
        ODESTEP_INFO("model '{}' has no closed-form solution, skipping the error report", problem.model);
    }

    return res;
}

double ConvergenceTable::error(size_t row, const std::string& method) const {
    auto it = std::find(methods.begin(), methods.end(), method);
    if(it == methods.end()) {
        throw std::out_of_range("method not in convergence table: " + method);
    }
    return rows.at(row).errors[it - methods.begin()];
}

ConvergenceTable convergence_study(const Problem& problem, double x0, double y0, double xf,
                                   const std::vector<double>& h_values, const IntegratorList& steppers) {
    if(!problem.has_solution()) {
        throw ConfigError("convergence study needs a closed-form solution");
    }

    ConvergenceTable table;
    for(const auto& stepper : steppers) {
        table.methods.push_back(stepper->name());
    }

    for(double h : h_values) {
        auto grid = StepConfig::towards(x0, y0, xf, h);
        auto res = run_comparison(problem, grid, xf, steppers);

        ConvergenceRow row;
        row.h = h;
        row.n = grid.n;
        row.x_final = res.methods.front().trajectory.back().x;
        for(const auto& e : res.report->entries()) {
            row.errors.push_back(e.abs_error);
        }
        ODESTEP_DEBUG("convergence: h = {}, n = {}", h, grid.n);
        table.rows.push_back(std::move(row));
    }

    return table;
}

}  // namespace odestep
