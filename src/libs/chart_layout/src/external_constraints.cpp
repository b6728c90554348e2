#include <chart_layout/external_constraints.hpp>
#include <stdexcept>

namespace chart_layout {

ExternalConstraint pin(const AttributeRef& ref, double value, chart_solver::ConstraintStrength strength) {
    ExternalConstraint c;
    c.strength = strength;
    c.constant = value;
    c.lhs.push_back({ 1.0, ref });
    return c;
}

ExternalConstraint align(const AttributeRef& a, const AttributeRef& b, chart_solver::ConstraintStrength strength) {
    ExternalConstraint c;
    c.strength = strength;
    c.lhs.push_back({ 1.0, a });
    c.rhs.push_back({ 1.0, b });
    return c;
}

ExternalConstraint offset(const AttributeRef& a, const AttributeRef& b, double distance,
    chart_solver::ConstraintStrength strength)
{
    ExternalConstraint c;
    c.strength = strength;
    c.constant = distance;
    c.lhs.push_back({ 1.0, b });
    c.rhs.push_back({ 1.0, a });
    return c;
}

ExternalConstraint at_least(const AttributeRef& ref, double value, chart_solver::ConstraintStrength strength) {
    if (!chart_solver::is_soft(strength))
        throw std::invalid_argument("at_least: inequalities must use a soft strength");
    ExternalConstraint c;
    c.strength = strength;
    c.kind = ConstraintKind::SoftInequality;
    c.constant = value;
    c.lhs.push_back({ 1.0, ref });
    return c;
}

} // namespace chart_layout
