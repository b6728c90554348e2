#pragma once

#include <chart_model/attribute_map.hpp>
#include <chart_solver/constraint_solver.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chart_elements {

// One pass of constraint collection and resolution. Binds the numeric
// attributes of attribute maps to solver variables seeded with their current
// values. Results are read back through the same maps once solve() succeeds.
class SolveSession {
public:
    explicit SolveSession(chart_solver::SolverOptions options = {});

    SolveSession(const SolveSession&) = delete;
    SolveSession& operator=(const SolveSession&) = delete;

    // Allocates one variable per numeric attribute, in schema order. Binding an
    // already bound map is a no-op.
    void bind(const chart_model::AttributeMap& attrs);
    bool is_bound(const chart_model::AttributeMap& attrs) const;

    // Variable for a numeric attribute, binding the map on first use.
    chart_solver::Variable attr(const chart_model::AttributeMap& attrs, const std::string& name);
    std::vector<chart_solver::Variable> attrs(const chart_model::AttributeMap& attrs,
        const std::vector<std::string>& names);

    std::size_t add_linear(chart_solver::ConstraintStrength strength, double constant,
        const std::vector<chart_solver::Term>& lhs, const std::vector<chart_solver::Term>& rhs = {});
    std::size_t add_soft_inequality(chart_solver::ConstraintStrength strength, double constant,
        const std::vector<chart_solver::Term>& lhs, const std::vector<chart_solver::Term>& rhs = {});
    std::size_t add_equals(chart_solver::ConstraintStrength strength,
        chart_solver::Variable a, chart_solver::Variable b);

    chart_solver::SolveResult solve();

    // Current variable value for a bound attribute.
    double value(const chart_model::AttributeMap& attrs, const std::string& name) const;

    // Copies every bound variable of `attrs` back into it.
    void write_back(chart_model::AttributeMap& attrs) const;

    chart_solver::ConstraintSolver& solver() { return solver_; }
    const chart_solver::ConstraintSolver& solver() const { return solver_; }

private:
    using Binding = std::vector<std::optional<chart_solver::Variable>>;

    const Binding& binding(const chart_model::AttributeMap& attrs) const;

    chart_solver::ConstraintSolver solver_;
    std::unordered_map<const chart_model::AttributeMap*, Binding> bindings_;
};

} // namespace chart_elements
