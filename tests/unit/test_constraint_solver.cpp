#include <chart_solver/constraint_solver.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace chart_solver;

// ─── Hard equations ──────────────────────────────────────────────────────────

TEST(ConstraintSolver, SolvesDeterminedHardSystem)
{
    ConstraintSolver solver;
    const Variable x = solver.new_variable(0.0);
    const Variable y = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Hard, 10.0, { { 1.0, x }, { 1.0, y } });
    solver.add_linear(ConstraintStrength::Hard, 2.0, { { 1.0, x } }, { { 1.0, y } });

    const SolveResult result = solver.solve();
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_NEAR(solver.value(x), 6.0, 1e-9);
    EXPECT_NEAR(solver.value(y), 4.0, 1e-9);
}

TEST(ConstraintSolver, UnderdeterminedHardSystemMovesSeedsMinimally)
{
    ConstraintSolver solver;
    const Variable a = solver.new_variable(0.0);
    const Variable b = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Hard, 10.0, { { 1.0, a }, { 1.0, b } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(a), 5.0, 1e-9);
    EXPECT_NEAR(solver.value(b), 5.0, 1e-9);
}

TEST(ConstraintSolver, SatisfiedSeedsAreLeftAlone)
{
    ConstraintSolver solver;
    const Variable a = solver.new_variable(3.0);
    const Variable b = solver.new_variable(7.0);
    solver.add_linear(ConstraintStrength::Hard, 10.0, { { 1.0, a }, { 1.0, b } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(a), 3.0, 1e-12);
    EXPECT_NEAR(solver.value(b), 7.0, 1e-12);
}

TEST(ConstraintSolver, RedundantConsistentEquationsAreAccepted)
{
    ConstraintSolver solver;
    const Variable x = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Hard, 3.0, { { 1.0, x } });
    solver.add_linear(ConstraintStrength::Hard, 6.0, { { 2.0, x } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(x), 3.0, 1e-9);
}

TEST(ConstraintSolver, ContradictoryHardPinsAreInfeasible)
{
    ConstraintSolver solver;
    const Variable v = solver.new_variable(1.0);
    const std::size_t first = solver.add_linear(ConstraintStrength::Hard, 0.0, { { 1.0, v } });
    const std::size_t second = solver.add_linear(ConstraintStrength::Hard, 5.0, { { 1.0, v } });

    const SolveResult result = solver.solve();
    EXPECT_EQ(result.status, SolveStatus::Infeasible);
    EXPECT_FALSE(result.message.empty());
    EXPECT_EQ(result.violated_constraints, (std::vector<std::size_t>{ first, second }));
    // Nothing is written back on failure.
    EXPECT_EQ(solver.value(v), 1.0);
}

TEST(ConstraintSolver, LargeSeedDoesNotHideContradiction)
{
    ConstraintSolver solver;
    const Variable x = solver.new_variable(1e10);
    const std::size_t first = solver.add_linear(ConstraintStrength::Hard, 0.0, { { 1.0, x } });
    const std::size_t second = solver.add_linear(ConstraintStrength::Hard, 5.0, { { 1.0, x } });

    const SolveResult result = solver.solve();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.violated_constraints, (std::vector<std::size_t>{ first, second }));
    EXPECT_DOUBLE_EQ(solver.value(x), 1e10);
}

TEST(ConstraintSolver, LargeSeedsStillSolveExactly)
{
    ConstraintSolver solver;
    const Variable x = solver.new_variable(1e10);
    const Variable y = solver.new_variable(-3e10);
    solver.add_linear(ConstraintStrength::Hard, 1.0, { { 1.0, x }, { 1.0, y } });
    solver.add_equals(ConstraintStrength::Hard, x, y);

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(x), 0.5, 1e-9);
    EXPECT_NEAR(solver.value(y), 0.5, 1e-9);
}

TEST(ConstraintSolver, CancellingTermsLeaveAConstantEquation)
{
    ConstraintSolver solver;
    const Variable a = solver.new_variable(2.0);
    solver.add_linear(ConstraintStrength::Hard, 5.0, { { 1.0, a } }, { { 1.0, a } });

    EXPECT_EQ(solver.solve().status, SolveStatus::Infeasible);
    EXPECT_EQ(solver.value(a), 2.0);
}

TEST(ConstraintSolver, MakeConstantPinsCurrentValue)
{
    ConstraintSolver solver;
    const Variable a = solver.new_variable(4.0);
    const Variable b = solver.new_variable(0.0);
    solver.make_constant(a);
    solver.add_linear(ConstraintStrength::Hard, 1.0, { { 1.0, b } }, { { 1.0, a } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(a), 4.0, 1e-9);
    EXPECT_NEAR(solver.value(b), 5.0, 1e-9);
}

// ─── Soft tiers ──────────────────────────────────────────────────────────────

TEST(ConstraintSolver, StrongerTierWins)
{
    ConstraintSolver solver;
    const Variable v = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Weak, 10.0, { { 1.0, v } });
    solver.add_linear(ConstraintStrength::Strong, 20.0, { { 1.0, v } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(v), 20.0, 1e-9);
}

TEST(ConstraintSolver, HardAlwaysBeatsSoft)
{
    ConstraintSolver solver;
    const Variable v = solver.new_variable(0.0, VariableStrength::Strong);
    solver.add_linear(ConstraintStrength::Strong, 20.0, { { 1.0, v } });
    solver.add_linear(ConstraintStrength::Hard, -3.0, { { 1.0, v } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(v), -3.0, 1e-9);
}

TEST(ConstraintSolver, SameTierConflictIsAveraged)
{
    ConstraintSolver solver;
    const Variable v = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Medium, 10.0, { { 1.0, v } });
    solver.add_linear(ConstraintStrength::Medium, 20.0, { { 1.0, v } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(v), 15.0, 1e-9);
}

TEST(ConstraintSolver, WeakPinOverridesWeakerStay)
{
    ConstraintSolver solver;
    const Variable w = solver.new_variable(60.0, VariableStrength::Weaker);
    solver.add_linear(ConstraintStrength::Weak, 80.0, { { 1.0, w } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(w), 80.0, 1e-9);
}

TEST(ConstraintSolver, StayKeepsSeedAgainstHardCorrection)
{
    // x2 - x1 = w with w held by a stay: the frame stretches around w.
    ConstraintSolver solver;
    const Variable x1 = solver.new_variable(-30.0);
    const Variable x2 = solver.new_variable(30.0);
    const Variable w = solver.new_variable(80.0, VariableStrength::Weaker);
    solver.add_linear(ConstraintStrength::Hard, 0.0, { { 1.0, x2 } }, { { 1.0, x1 }, { 1.0, w } });

    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(w), 80.0, 1e-9);
    EXPECT_NEAR(solver.value(x2) - solver.value(x1), 80.0, 1e-9);
    EXPECT_NEAR(solver.value(x1), -40.0, 1e-9);
    EXPECT_NEAR(solver.value(x2), 40.0, 1e-9);
}

// ─── Soft inequalities ───────────────────────────────────────────────────────

TEST(ConstraintSolver, ViolatedInequalityIsActivated)
{
    ConstraintSolver solver;
    const Variable s = solver.new_variable(5.0, VariableStrength::Weaker);
    solver.add_linear(ConstraintStrength::Weak, -10.0, { { 1.0, s } });
    solver.add_soft_inequality(ConstraintStrength::Strong, 0.0, { { 1.0, s } });

    const SolveResult result = solver.solve();
    ASSERT_TRUE(result.ok());
    EXPECT_NEAR(solver.value(s), 0.0, 1e-9);
    EXPECT_EQ(result.inequality_passes, 2);
}

TEST(ConstraintSolver, SatisfiedInequalityStaysInactive)
{
    ConstraintSolver solver;
    const Variable s = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Weak, 5.0, { { 1.0, s } });
    solver.add_soft_inequality(ConstraintStrength::Strong, 0.0, { { 1.0, s } });

    const SolveResult result = solver.solve();
    ASSERT_TRUE(result.ok());
    EXPECT_NEAR(solver.value(s), 5.0, 1e-9);
    EXPECT_EQ(result.inequality_passes, 1);
}

TEST(ConstraintSolver, TightestBoundOfATierWins)
{
    ConstraintSolver solver;
    const Variable x = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Weak, -10.0, { { 1.0, x } });
    solver.add_soft_inequality(ConstraintStrength::Strong, 0.0, { { 1.0, x } });
    solver.add_soft_inequality(ConstraintStrength::Strong, 5.0, { { 1.0, x } });

    const SolveResult result = solver.solve();
    ASSERT_TRUE(result.ok());
    EXPECT_NEAR(solver.value(x), 5.0, 1e-9);
    EXPECT_EQ(result.inequality_passes, 2);
}

TEST(ConstraintSolver, SlackInequalityIsReleased)
{
    // x >= 0 is enforced first; once x - y >= 3 holds, x sits strictly
    // above zero and the first bound is dropped again.
    ConstraintSolver solver;
    const Variable x = solver.new_variable(0.0);
    const Variable y = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Hard, 0.0, { { 1.0, y } });
    solver.add_linear(ConstraintStrength::Weak, -10.0, { { 1.0, x } });
    solver.add_soft_inequality(ConstraintStrength::Medium, 0.0, { { 1.0, x } });
    solver.add_soft_inequality(ConstraintStrength::Strong, 3.0, { { 1.0, x } }, { { 1.0, y } });

    const SolveResult result = solver.solve();
    ASSERT_TRUE(result.ok());
    EXPECT_NEAR(solver.value(x), 3.0, 1e-9);
    EXPECT_NEAR(solver.value(y), 0.0, 1e-9);
    EXPECT_EQ(result.inequality_passes, 4);
}

TEST(ConstraintSolver, HardInequalityIsRejected)
{
    ConstraintSolver solver;
    const Variable s = solver.new_variable(0.0);
    EXPECT_THROW(solver.add_soft_inequality(ConstraintStrength::Hard, 0.0, { { 1.0, s } }),
        std::invalid_argument);
}

// ─── Structure and determinism ───────────────────────────────────────────────

TEST(ConstraintSolver, IndependentSubsystemsFormSeparateBlocks)
{
    ConstraintSolver solver;
    const Variable a = solver.new_variable(0.0);
    const Variable b = solver.new_variable(0.0);
    const Variable c = solver.new_variable(0.0);
    const Variable d = solver.new_variable(7.0);
    solver.add_linear(ConstraintStrength::Hard, 1.0, { { 1.0, a } }, { { 1.0, b } });
    solver.add_linear(ConstraintStrength::Medium, 2.0, { { 1.0, c } });

    const SolveResult result = solver.solve();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.block_count, 3u);
    EXPECT_NEAR(solver.value(a) - solver.value(b), 1.0, 1e-9);
    EXPECT_NEAR(solver.value(c), 2.0, 1e-9);
    EXPECT_EQ(solver.value(d), 7.0);
}

TEST(ConstraintSolver, SecondSolveIsIdempotent)
{
    ConstraintSolver solver;
    const Variable x1 = solver.new_variable(-30.0);
    const Variable x2 = solver.new_variable(30.0);
    const Variable w = solver.new_variable(60.0, VariableStrength::Weaker);
    const Variable c = solver.new_variable(0.0);
    solver.add_linear(ConstraintStrength::Hard, 0.0, { { 1.0, x2 } }, { { 1.0, x1 }, { 1.0, w } });
    solver.add_linear(ConstraintStrength::Hard, 0.0, { { 2.0, c } }, { { 1.0, x1 }, { 1.0, x2 } });
    solver.add_linear(ConstraintStrength::Medium, 100.0, { { 1.0, c } });
    solver.add_linear(ConstraintStrength::Weak, 75.0, { { 1.0, w } });

    ASSERT_TRUE(solver.solve().ok());
    const double first[] = { solver.value(x1), solver.value(x2), solver.value(w), solver.value(c) };
    ASSERT_TRUE(solver.solve().ok());
    EXPECT_NEAR(solver.value(x1), first[0], 1e-9);
    EXPECT_NEAR(solver.value(x2), first[1], 1e-9);
    EXPECT_NEAR(solver.value(w), first[2], 1e-9);
    EXPECT_NEAR(solver.value(c), first[3], 1e-9);
    EXPECT_NEAR(first[2], 75.0, 1e-9);
    EXPECT_NEAR(first[3], 100.0, 1e-9);
}

TEST(ConstraintSolver, IdenticalInputsGiveIdenticalResults)
{
    auto run = []() {
        ConstraintSolver solver;
        const Variable a = solver.new_variable(1.0, VariableStrength::Weak);
        const Variable b = solver.new_variable(2.0);
        const Variable c = solver.new_variable(3.0, VariableStrength::Weaker);
        solver.add_linear(ConstraintStrength::Hard, 4.0, { { 1.0, a }, { 2.0, b } }, { { 0.5, c } });
        solver.add_linear(ConstraintStrength::Medium, 9.0, { { 1.0, b }, { 1.0, c } });
        solver.add_soft_inequality(ConstraintStrength::Strong, 0.0, { { 1.0, a } });
        EXPECT_TRUE(solver.solve().ok());
        return std::vector<double>{ solver.value(a), solver.value(b), solver.value(c) };
    };
    EXPECT_EQ(run(), run());
}

// ─── Handles ─────────────────────────────────────────────────────────────────

TEST(ConstraintSolver, ForeignVariableIsRejected)
{
    ConstraintSolver solver;
    (void)solver.new_variable(0.0);
    EXPECT_THROW(solver.value(Variable{ 5 }), std::out_of_range);
    EXPECT_THROW(solver.add_linear(ConstraintStrength::Hard, 0.0, { { 1.0, Variable{ 5 } } }), std::out_of_range);
}

TEST(ConstraintSolver, NonFiniteInputsAreRejected)
{
    ConstraintSolver solver;
    EXPECT_THROW(solver.new_variable(std::numeric_limits<double>::infinity()), std::invalid_argument);
    const Variable v = solver.new_variable(0.0);
    EXPECT_THROW(solver.set_value(v, std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(solver.add_linear(ConstraintStrength::Hard, std::numeric_limits<double>::quiet_NaN(),
                     { { 1.0, v } }),
        std::invalid_argument);
}
