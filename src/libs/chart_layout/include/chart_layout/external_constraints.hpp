#pragma once

#include <chart_solver/strength.hpp>
#include <string>
#include <vector>

namespace chart_layout {

// An attribute of a live element, addressed by element id.
struct AttributeRef {
    std::string element_id;
    std::string attribute;
};

struct ExternalTerm {
    double coefficient = 1.0;
    AttributeRef ref;
};

enum class ConstraintKind {
    Equality,       // sum(lhs) = sum(rhs) + constant
    SoftInequality  // sum(lhs) >= sum(rhs) + constant
};

// User-level constraint between attributes of any elements in the chart:
// cross-element alignment, numeric pins from the attribute panel, drag pins.
struct ExternalConstraint {
    chart_solver::ConstraintStrength strength = chart_solver::ConstraintStrength::Strong;
    ConstraintKind kind = ConstraintKind::Equality;
    double constant = 0.0;
    std::vector<ExternalTerm> lhs;
    std::vector<ExternalTerm> rhs;
};

// ref = value
ExternalConstraint pin(const AttributeRef& ref, double value,
    chart_solver::ConstraintStrength strength = chart_solver::ConstraintStrength::Strong);

// a = b
ExternalConstraint align(const AttributeRef& a, const AttributeRef& b,
    chart_solver::ConstraintStrength strength = chart_solver::ConstraintStrength::Strong);

// b = a + distance
ExternalConstraint offset(const AttributeRef& a, const AttributeRef& b, double distance,
    chart_solver::ConstraintStrength strength = chart_solver::ConstraintStrength::Strong);

// ref >= value, soft strengths only.
ExternalConstraint at_least(const AttributeRef& ref, double value,
    chart_solver::ConstraintStrength strength = chart_solver::ConstraintStrength::Strong);

} // namespace chart_layout
