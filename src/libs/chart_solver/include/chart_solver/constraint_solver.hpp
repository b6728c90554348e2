#pragma once

#include <chart_solver/strength.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace chart_solver {

// Handle to one scalar unknown owned by a ConstraintSolver.
struct Variable {
    std::size_t index = 0;

    friend bool operator==(const Variable& a, const Variable& b) { return a.index == b.index; }
    friend bool operator!=(const Variable& a, const Variable& b) { return a.index != b.index; }
};

// (coefficient, variable)
using Term = std::pair<double, Variable>;

struct SolverOptions {
    // Relative residual a hard equation may keep before the system is infeasible.
    double tolerance = 1e-9;
    // Relative pivot threshold used for rank decisions.
    double rank_threshold = 1e-10;
    // Upper bound on re-solves triggered by newly violated soft inequalities.
    int max_inequality_passes = 16;
};

enum class SolveStatus {
    Solved,
    Infeasible
};

struct SolveResult {
    SolveStatus status = SolveStatus::Solved;
    std::string message;
    // Ids (as returned by add_linear) of hard equations left unsatisfied.
    std::vector<std::size_t> violated_constraints;
    std::size_t block_count = 0;
    int inequality_passes = 0;

    bool ok() const { return status == SolveStatus::Solved; }
};

// Linear constraint solver over scalar variables.
//
// Hard equations are satisfied exactly. Soft equations and soft inequalities
// are resolved tier by tier (strong, medium, weak, weaker) as least-squares
// problems restricted to the solutions of every stronger tier. Variables with
// a stay strength are pulled toward their seed value after the explicit
// constraints of the matching tier. Directions left free by every tier keep
// their seed values.
class ConstraintSolver {
public:
    explicit ConstraintSolver(SolverOptions options = {});

    Variable new_variable(double initial, VariableStrength strength = VariableStrength::None);

    // sum(lhs) = sum(rhs) + constant. Returns the constraint id.
    std::size_t add_linear(ConstraintStrength strength, double constant,
        const std::vector<Term>& lhs, const std::vector<Term>& rhs = {});

    // sum(lhs) >= sum(rhs) + constant, soft strengths only.
    std::size_t add_soft_inequality(ConstraintStrength strength, double constant,
        const std::vector<Term>& lhs, const std::vector<Term>& rhs = {});

    // a = b
    std::size_t add_equals(ConstraintStrength strength, Variable a, Variable b);

    // Pins v to its current value.
    std::size_t make_constant(Variable v);

    // Solves every variable. Values are written back only on success.
    SolveResult solve();

    double value(Variable v) const;
    void set_value(Variable v, double value);
    VariableStrength strength(Variable v) const;

    std::size_t variable_count() const { return variables_.size(); }
    std::size_t constraint_count() const { return rows_.size(); }
    const SolverOptions& options() const { return options_; }

private:
    struct VariableState {
        double value = 0.0;
        VariableStrength strength = VariableStrength::None;
    };

    // sum(coefficients) = constant, or >= constant for inequalities.
    struct Row {
        ConstraintStrength strength = ConstraintStrength::Hard;
        bool inequality = false;
        std::vector<std::pair<std::size_t, double>> coefficients;
        double constant = 0.0;
    };

    struct Block {
        std::vector<std::size_t> variables;
        std::vector<std::size_t> rows;
    };

    std::size_t add_row(ConstraintStrength strength, bool inequality, double constant,
        const std::vector<Term>& lhs, const std::vector<Term>& rhs);
    void check_variable(Variable v) const;
    std::vector<Block> partition() const;
    // `magnitude` is sum |coefficient * value| at the solved point.
    bool row_satisfied(const Row& row, double activity, double magnitude) const;

    SolverOptions options_;
    std::vector<VariableState> variables_;
    std::vector<Row> rows_;
};

} // namespace chart_solver
