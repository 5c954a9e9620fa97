#pragma once
#include <cmath>
#include <string>
#include <vector>

#include "types.hpp"

namespace odestep {

struct MethodResult {
    std::string method;
    int order = 0;
    Trajectory trajectory;
};

struct ErrorEntry {
    std::string method;
    State final_state;
    // |y(x_n) - y_n|, at the last grid point
    double abs_error = 0.0;
    // |y(xf) - y_n|, against the requested end of the interval
    double target_error = 0.0;
};

// Per-method errors, in the order the methods were run.
class ErrorReport {
public:
    ErrorReport() = default;
    ErrorReport(double x_target, double reference_at_target, std::vector<ErrorEntry> entries)
        : x_target_(x_target), reference_at_target_(reference_at_target), entries_(std::move(entries)) {}

    double x_target() const { return x_target_; }
    double reference_at_target() const { return reference_at_target_; }
    const std::vector<ErrorEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    const ErrorEntry* find(const std::string& method) const {
        for(const auto& e : entries_) {
            if(e.method == method) return &e;
        }
        return nullptr;
    }

    const ErrorEntry& at(const std::string& method) const {
        if(auto e = find(method)) {
            return *e;
        }
        throw std::out_of_range("no error entry for method: " + method);
    }

private:
    double x_target_ = 0.0;
    double reference_at_target_ = 0.0;
    std::vector<ErrorEntry> entries_;
};

struct Comparator {
    static double abs_error(double reference, double approx) {
        return std::fabs(reference - approx);
    }

    static ErrorEntry entry(const MethodResult& r, const SolutionFn& solution, double reference_at_target) {
        if(r.trajectory.empty()) {
            throw std::runtime_error("method '" + r.method + "' produced an empty trajectory");
        }
        const State& last = r.trajectory.back();
        ErrorEntry e;
        e.method = r.method;
        e.final_state = last;
        e.abs_error = abs_error(solution(last.x), last.y);
        e.target_error = abs_error(reference_at_target, last.y);
        return e;
    }

    static ErrorReport compare(const std::vector<MethodResult>& results, const SolutionFn& solution, double x_target) {
        if(!solution) {
            throw ConfigError("error report requires a closed-form solution");
        }
        const double ref_target = solution(x_target);

        std::vector<ErrorEntry> entries;
        entries.reserve(results.size());
        for(const auto& r : results) {
            entries.push_back(entry(r, solution, ref_target));
        }
        return ErrorReport(x_target, ref_target, std::move(entries));
    }
};

}  // namespace odestep
