#pragma once
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace odestep {

// right-hand side of y'(x) = f(x, y)
using DerivativeFn = std::function<double(double /*x*/, double /*y*/)>;
// closed-form y(x), used only as ground truth
using SolutionFn = std::function<double(double /*x*/)>;

struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct State {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const State& a, const State& b) {
    return a.x == b.x && a.y == b.y;
}

// Samples 0..n of a solution. Once built it can only be read.
class Trajectory {
public:
    Trajectory() = default;
    explicit Trajectory(std::vector<State> samples) : samples_(std::move(samples)) {}

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    // number of steps taken (size - 1)
    int steps() const { return samples_.empty() ? 0 : static_cast<int>(samples_.size()) - 1; }

    const State& operator[](size_t i) const { return samples_[i]; }
    const State& front() const { return samples_.front(); }
    const State& back() const { return samples_.back(); }

    std::vector<State>::const_iterator begin() const { return samples_.begin(); }
    std::vector<State>::const_iterator end() const { return samples_.end(); }

    std::vector<double> xs() const {
        std::vector<double> out;
        out.reserve(samples_.size());
        for(const auto& s : samples_) out.push_back(s.x);
        return out;
    }

    std::vector<double> ys() const {
        std::vector<double> out;
        out.reserve(samples_.size());
        for(const auto& s : samples_) out.push_back(s.y);
        return out;
    }

    bool operator==(const Trajectory& o) const { return samples_ == o.samples_; }

private:
    std::vector<State> samples_;
};

}  // namespace odestep
