#include <odestep/core/comparison.hpp>
#include <odestep/core/reference.hpp>

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

using namespace odestep;

TEST(ReferenceSamplerTest, SamplesClosedFormOnTheGrid) {
    StepConfig cfg(0.0, 160.0, 10.0, 4);
    auto ref = sample_reference(cfg, odestep::test::pie_solution);

    ASSERT_EQ(ref.size(), 5u);
    EXPECT_EQ(ref.front(), (State{0.0, 160.0}));
    for(size_t i = 1; i < ref.size(); i++) {
        EXPECT_DOUBLE_EQ(ref[i].x, 10.0 * i);
        EXPECT_DOUBLE_EQ(ref[i].y, odestep::test::pie_solution(10.0 * i));
    }
}

TEST(ReferenceSamplerTest, FirstSampleIsTheGivenInitialCondition) {
    // y0 deliberately off the closed form
    StepConfig cfg(0.0, 1.0, 0.5, 2);
    auto ref = sample_reference(cfg, [](double x) { return 10.0 + x; });
    EXPECT_DOUBLE_EQ(ref[0].y, 1.0);
    EXPECT_DOUBLE_EQ(ref[1].y, 10.5);
    EXPECT_DOUBLE_EQ(ref[2].y, 11.0);
}

TEST(ReferenceSamplerTest, MissingSolutionIsAConfigError) {
    StepConfig cfg(0.0, 1.0, 0.5, 2);
    EXPECT_THROW(sample_reference(cfg, SolutionFn{}), ConfigError);
}

TEST(ComparatorTest, AbsoluteError) {
    EXPECT_DOUBLE_EQ(Comparator::abs_error(2.0, 3.5), 1.5);
    EXPECT_DOUBLE_EQ(Comparator::abs_error(3.5, 2.0), 1.5);
    EXPECT_DOUBLE_EQ(Comparator::abs_error(-1.0, -1.0), 0.0);
}

TEST(ComparatorTest, ErrorsAtFinalPointAndAtTarget) {
    auto solution = [](double x) { return x * x; };
    std::vector<MethodResult> results;
    results.push_back({"a", 1, Trajectory({{0.0, 0.0}, {2.0, 3.0}})});
    results.push_back({"b", 2, Trajectory({{0.0, 0.0}, {2.0, 4.5}})});

    auto report = Comparator::compare(results, solution, 3.0);

    EXPECT_DOUBLE_EQ(report.x_target(), 3.0);
    EXPECT_DOUBLE_EQ(report.reference_at_target(), 9.0);
    ASSERT_EQ(report.size(), 2u);
    EXPECT_EQ(report.entries()[0].method, "a");
    EXPECT_EQ(report.entries()[1].method, "b");

    const auto& a = report.at("a");
    EXPECT_EQ(a.final_state, (State{2.0, 3.0}));
    EXPECT_DOUBLE_EQ(a.abs_error, 1.0);
    EXPECT_DOUBLE_EQ(a.target_error, 6.0);

    const auto& b = report.at("b");
    EXPECT_DOUBLE_EQ(b.abs_error, 0.5);
    EXPECT_DOUBLE_EQ(b.target_error, 4.5);
}

TEST(ComparatorTest, LookupOfUnknownMethod) {
    ErrorReport report;
    EXPECT_EQ(report.find("rk4"), nullptr);
    EXPECT_THROW(report.at("rk4"), std::out_of_range);
}

TEST(ComparatorTest, EmptyTrajectoryIsAnError) {
    std::vector<MethodResult> results;
    results.push_back({"empty", 1, Trajectory()});
    EXPECT_THROW(Comparator::compare(results, [](double x) { return x; }, 1.0), std::runtime_error);
}

TEST(ComparatorTest, MissingSolutionIsAConfigError) {
    std::vector<MethodResult> results;
    EXPECT_THROW(Comparator::compare(results, SolutionFn{}, 1.0), ConfigError);
}
