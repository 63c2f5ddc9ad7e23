#include <gtest/gtest.h>
#include "BatchSolver.hpp"
#include "LineSolver.hpp"

namespace {

class LineSolverTest : public ::testing::Test {
protected:
    LineCase line_case = LineCase::defaults();
};

TEST_F(LineSolverTest, SolvesAllGroups) {
    LineSolution s = LineSolver(line_case).solve();
    EXPECT_TRUE(s.ok());
    ASSERT_TRUE(s.resistance && s.inductance && s.capacitance);
    EXPECT_NEAR(s.resistance->per_km, 0.0642407, 1e-6);
    EXPECT_NEAR(s.inductance->per_km, 1.3756e-3, 1e-7);
    EXPECT_NEAR(s.capacitance->per_km, 7.819494e-9, 1e-14);
}

TEST_F(LineSolverTest, CapacitanceFailureKeepsEarlierGroups) {
    line_case.capacitance->height_m = 0.0;
    LineSolution s = LineSolver(line_case).solve();
    EXPECT_FALSE(s.ok());
    EXPECT_TRUE(s.resistance.has_value());
    EXPECT_TRUE(s.inductance.has_value());
    EXPECT_FALSE(s.capacitance.has_value());
    ASSERT_EQ(s.errors.count("capacitance"), 1u);
    EXPECT_EQ(s.errors.size(), 1u);
}

TEST_F(LineSolverTest, ResistanceFailureDoesNotBlockOthers) {
    line_case.resistance->conductor.area = 0.0;
    LineSolution s = LineSolver(line_case).solve();
    EXPECT_FALSE(s.resistance.has_value());
    EXPECT_TRUE(s.inductance.has_value());
    EXPECT_TRUE(s.capacitance.has_value());
    EXPECT_EQ(s.errors.count("resistance"), 1u);
}

TEST_F(LineSolverTest, BatchPreservesOrder) {
    std::vector<LineCase> cases;
    for (int i = 0; i < 16; ++i) {
        LineCase c = LineCase::defaults();
        c.name = "case_" + std::to_string(i);
        c.resistance->conditions.length_km = 1.0 + i;
        if (i == 5) c.inductance->gmr_m = -1.0;
        cases.push_back(c);
    }

    std::vector<LineSolution> results = solve_batch(cases);
    ASSERT_EQ(results.size(), cases.size());
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(results[i].name, cases[i].name);
        ASSERT_TRUE(results[i].resistance.has_value());
        EXPECT_DOUBLE_EQ(results[i].resistance->total, results[i].resistance->per_km * (1.0 + i));
    }
    EXPECT_FALSE(results[5].inductance.has_value());
    EXPECT_TRUE(results[6].inductance.has_value());
}

TEST(BatchSolverTest, EverySlotKeepsItsCaseIdentity) {
    std::vector<LineCase> cases(3, LineCase::defaults());
    for (int i = 0; i < 3; ++i) {
        cases[i].name = "line";
        cases[i].stem = "file_" + std::to_string(i);
    }
    cases[1].resistance->conductor.area = 0.0;
    cases[1].inductance->radius_m = 0.0;
    cases[1].capacitance->height_m = 0.0;

    std::vector<LineSolution> results = solve_batch(cases);
    ASSERT_EQ(results.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(results[i].stem, "file_" + std::to_string(i));
    }
    EXPECT_EQ(results[1].errors.size(), 3u);
    EXPECT_TRUE(results[2].ok());
}

TEST(BatchSolverTest, EmptyBatch) {
    EXPECT_TRUE(solve_batch({}).empty());
}

} // namespace
