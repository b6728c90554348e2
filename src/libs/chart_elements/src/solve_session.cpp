#include <chart_elements/solve_session.hpp>
#include <chart_model/errors.hpp>
#include <stdexcept>

namespace chart_elements {

SolveSession::SolveSession(chart_solver::SolverOptions options)
    : solver_(options)
{
}

void SolveSession::bind(const chart_model::AttributeMap& attrs) {
    if (bindings_.count(&attrs)) return;

    const auto& schema = attrs.schema();
    Binding vars(schema.size());
    for (std::size_t i = 0; i < schema.size(); ++i) {
        const auto& d = schema.at(i);
        if (d.kind != chart_model::AttributeKind::Number) continue;
        vars[i] = solver_.new_variable(attrs.number_at(i), d.strength);
    }
    bindings_.emplace(&attrs, std::move(vars));
}

bool SolveSession::is_bound(const chart_model::AttributeMap& attrs) const {
    return bindings_.count(&attrs) != 0;
}

const SolveSession::Binding& SolveSession::binding(const chart_model::AttributeMap& attrs) const {
    const auto it = bindings_.find(&attrs);
    if (it == bindings_.end())
        throw std::logic_error("attribute map of " + attrs.schema().owner() + " is not bound to this session");
    return it->second;
}

chart_solver::Variable SolveSession::attr(const chart_model::AttributeMap& attrs, const std::string& name) {
    bind(attrs);
    const std::size_t index = attrs.schema().require(name);
    const auto& v = binding(attrs)[index];
    if (!v) {
        throw chart_model::AttributeKindError(name, chart_model::to_string(attrs.schema().at(index).kind),
            chart_model::to_string(chart_model::AttributeKind::Number));
    }
    return *v;
}

std::vector<chart_solver::Variable> SolveSession::attrs(const chart_model::AttributeMap& attrs,
    const std::vector<std::string>& names)
{
    std::vector<chart_solver::Variable> out;
    out.reserve(names.size());
    for (const auto& n : names) out.push_back(attr(attrs, n));
    return out;
}

std::size_t SolveSession::add_linear(chart_solver::ConstraintStrength strength, double constant,
    const std::vector<chart_solver::Term>& lhs, const std::vector<chart_solver::Term>& rhs)
{
    return solver_.add_linear(strength, constant, lhs, rhs);
}

std::size_t SolveSession::add_soft_inequality(chart_solver::ConstraintStrength strength, double constant,
    const std::vector<chart_solver::Term>& lhs, const std::vector<chart_solver::Term>& rhs)
{
    return solver_.add_soft_inequality(strength, constant, lhs, rhs);
}

std::size_t SolveSession::add_equals(chart_solver::ConstraintStrength strength,
    chart_solver::Variable a, chart_solver::Variable b)
{
    return solver_.add_equals(strength, a, b);
}

chart_solver::SolveResult SolveSession::solve() {
    return solver_.solve();
}

double SolveSession::value(const chart_model::AttributeMap& attrs, const std::string& name) const {
    const std::size_t index = attrs.schema().require(name);
    const auto& v = binding(attrs)[index];
    if (!v) {
        throw chart_model::AttributeKindError(name, chart_model::to_string(attrs.schema().at(index).kind),
            chart_model::to_string(chart_model::AttributeKind::Number));
    }
    return solver_.value(*v);
}

void SolveSession::write_back(chart_model::AttributeMap& attrs) const {
    const Binding& vars = binding(attrs);
    for (std::size_t i = 0; i < vars.size(); ++i) {
        if (vars[i]) attrs.set_number_at(i, solver_.value(*vars[i]));
    }
}

} // namespace chart_elements
