#include "core/simulation.hpp"
#include "io/plain.hpp"
#include "io/report.hpp"

#include <odestep/integrators/euler.hpp>
#include <odestep/integrators/improved_euler.hpp>
#include <odestep/integrators/rk4.hpp>

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace odestep;

namespace {

IntegratorList all_steppers() {
    IntegratorList v;
    v.push_back(std::make_unique<Euler>());
    v.push_back(std::make_unique<ImprovedEuler>());
    v.push_back(std::make_unique<RK4>());
    return v;
}

Problem pie_problem() {
    Problem p;
    p.model = "pie";
    p.derivative = odestep::test::pie_dydx;
    p.solution = odestep::test::pie_solution;
    return p;
}

std::vector<std::string> read_lines(const std::string& filename) {
    std::ifstream is(filename);
    std::vector<std::string> lines;
    std::string line;
    while(std::getline(is, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST(ConsoleReportTest, PieSummary) {
    auto steppers = all_steppers();
    auto res = run_comparison(pie_problem(), StepConfig::towards(0.0, 160.0, 47.0, 10.0), 47.0, steppers);

    auto text = io::format_report(res, 6);
    EXPECT_NE(text.find("SIMULATION {n: 4; h: 10}"), std::string::npos) << text;
    EXPECT_NE(text.find("Results for y(47):"), std::string::npos) << text;
    EXPECT_NE(text.find("(40.000000; 35.035008)"), std::string::npos) << text;
    EXPECT_NE(text.find("(40.000000; 38.976153)"), std::string::npos) << text;
    EXPECT_NE(text.find("improved_euler"), std::string::npos) << text;
    EXPECT_NE(text.find("Solution: y(47) = 37.088"), std::string::npos) << text;
}

TEST(ConsoleReportTest, RoundingFollowsDigits) {
    auto steppers = all_steppers();
    auto res = run_comparison(pie_problem(), StepConfig::towards(0.0, 160.0, 47.0, 10.0), 47.0, steppers);

    auto text = io::format_report(res, 2);
    EXPECT_NE(text.find("(40.00; 35.04)"), std::string::npos) << text;
}

TEST(ConsoleReportTest, NoClosedForm) {
    IntegratorList steppers;
    steppers.push_back(std::make_unique<Euler>());
    auto res = run_comparison(make_problem(Riccati(), 0.0, 0.0), StepConfig(0.0, 0.0, 0.5, 2), 1.0, steppers);

    auto text = io::format_report(res, 3);
    EXPECT_NE(text.find("no closed form"), std::string::npos) << text;
    EXPECT_EQ(text.find("Error"), std::string::npos) << text;
}

TEST(ConsoleReportTest, ConvergenceTable) {
    auto steppers = all_steppers();
    auto table = convergence_study(pie_problem(), 0.0, 160.0, 47.0, {1.0, 0.5}, steppers);

    auto text = io::format_convergence(table);
    EXPECT_NE(text.find("rk4"), std::string::npos);
    EXPECT_NE(text.find("x_final"), std::string::npos);
    // header plus one line per step size
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 4);
}

TEST(PlainWriterTest, TrajectoryColumns) {
    auto steppers = all_steppers();
    auto res = run_comparison(pie_problem(), StepConfig::towards(0.0, 160.0, 47.0, 10.0), 47.0, steppers);

    const std::string filename = "report_test_trajectories.dat";
    io::write_trajectories_plain(res, "pie", filename);
    auto lines = read_lines(filename);
    std::remove(filename.c_str());

    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "# model = pie, n = 4, h = 10, columns = x euler improved_euler rk4 reference");

    std::istringstream first(lines[1]);
    double x, e, h, r, ref;
    first >> x >> e >> h >> r >> ref;
    EXPECT_DOUBLE_EQ(x, 0.0);
    EXPECT_DOUBLE_EQ(e, 160.0);
    EXPECT_DOUBLE_EQ(ref, 160.0);

    std::istringstream last(lines[5]);
    last >> x >> e >> h >> r >> ref;
    EXPECT_DOUBLE_EQ(x, 40.0);
    EXPECT_NEAR(e, res.methods[0].trajectory.back().y, 1e-12);
    EXPECT_NEAR(r, res.methods[2].trajectory.back().y, 1e-12);
    EXPECT_NEAR(ref, odestep::test::pie_solution(40.0), 1e-12);
}

TEST(PlainWriterTest, ConvergenceColumns) {
    auto steppers = all_steppers();
    auto table = convergence_study(pie_problem(), 0.0, 160.0, 47.0, {1.0, 0.5}, steppers);

    const std::string filename = "report_test_convergence.dat";
    io::write_convergence_plain(table, filename);
    auto lines = read_lines(filename);
    std::remove(filename.c_str());

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "# columns = h n x_final euler improved_euler rk4");

    std::istringstream row(lines[2]);
    double h, x_final, e1, e2, e3;
    int n;
    row >> h >> n >> x_final >> e1 >> e2 >> e3;
    EXPECT_DOUBLE_EQ(h, 0.5);
    EXPECT_EQ(n, 94);
    EXPECT_NEAR(e3, table.error(1, "rk4"), 1e-20);
}

TEST(PlainWriterTest, UnwritablePath) {
    auto steppers = all_steppers();
    auto res = run_comparison(pie_problem(), StepConfig(0.0, 160.0, 10.0, 1), 10.0, steppers);
    EXPECT_THROW(io::write_trajectories_plain(res, "pie", "/nonexistent/dir/out.dat"), std::runtime_error);
}
