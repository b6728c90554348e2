#include <chart_layout/orchestrator.hpp>
#include <chart_elements/solve_session.hpp>
#include <chart_solver/log.hpp>
#include <chrono>
#include <cmath>
#include <unordered_map>

namespace chart_layout {

namespace {

using chart_elements::Element;

// Chart first, then each glyph followed by its marks.
std::vector<Element*> collect_elements(chart_elements::Chart& chart) {
    std::vector<Element*> out;
    out.push_back(&chart);
    for (std::size_t g = 0; g < chart.glyph_count(); ++g) {
        chart_elements::Glyph& glyph = chart.glyph(g);
        out.push_back(&glyph);
        for (std::size_t m = 0; m < glyph.mark_count(); ++m) out.push_back(&glyph.mark(m));
    }
    return out;
}

std::vector<chart_solver::Term> resolve_terms(chart_elements::SolveSession& session,
    const std::unordered_map<std::string, const Element*>& by_id, const std::vector<ExternalTerm>& terms)
{
    std::vector<chart_solver::Term> out;
    out.reserve(terms.size());
    for (const auto& t : terms) {
        const auto it = by_id.find(t.ref.element_id);
        if (it == by_id.end()) throw UnknownElementError(t.ref.element_id);
        out.emplace_back(t.coefficient, session.attr(it->second->attributes(), t.ref.attribute));
    }
    return out;
}

} // namespace

UnknownElementError::UnknownElementError(const std::string& element_id)
    : std::out_of_range("no element with id '" + element_id + "' in the chart")
    , element_id_(element_id)
{
}

SolveOrchestrator::SolveOrchestrator(chart_solver::SolverOptions options, chart_elements::Catalog& catalog)
    : options_(options)
{
    catalog.freeze();
}

SolveReport SolveOrchestrator::solve(chart_elements::Chart& chart,
    const std::vector<ExternalConstraint>& constraints) const
{
    const auto start = std::chrono::steady_clock::now();
    auto log = chart_solver::logger();

    const std::vector<Element*> elements = collect_elements(chart);
    std::unordered_map<std::string, const Element*> by_id;
    for (const Element* e : elements) {
        if (!by_id.emplace(e->id(), e).second)
            throw std::invalid_argument("element id '" + e->id() + "' appears twice in the chart");
    }

    chart_elements::SolveSession session(options_);
    for (const Element* e : elements) session.bind(e->attributes());

    chart.chart_class().build_intrinsic_constraints(session, chart);
    for (const auto& glyph : chart.glyphs()) {
        glyph.glyph_class().build_intrinsic_constraints(session, glyph);
        for (const auto& mark : glyph.marks()) mark.mark_class().build_intrinsic_constraints(session, mark);
    }

    for (const auto& c : constraints) {
        const auto lhs = resolve_terms(session, by_id, c.lhs);
        const auto rhs = resolve_terms(session, by_id, c.rhs);
        if (c.kind == ConstraintKind::SoftInequality) session.add_soft_inequality(c.strength, c.constant, lhs, rhs);
        else session.add_linear(c.strength, c.constant, lhs, rhs);
    }

    const chart_solver::SolveResult result = session.solve();

    SolveReport report;
    report.element_count = elements.size();
    report.variable_count = session.solver().variable_count();
    report.constraint_count = session.solver().constraint_count();
    report.block_count = result.block_count;
    report.status = result.status;
    report.message = result.message;

    auto stamp = [&report, start]() {
        report.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    if (!result.ok()) {
        log->warn("chart {} not updated: {}", chart.id(), report.message);
        stamp();
        return report;
    }

    for (const Element* e : elements) {
        const auto& attrs = e->attributes();
        for (const auto& d : attrs.schema().attributes()) {
            if (d.kind != chart_model::AttributeKind::Number) continue;
            if (!std::isfinite(session.value(attrs, d.name))) {
                report.status = chart_solver::SolveStatus::Infeasible;
                report.message = "solution for " + e->id() + "." + d.name + " is not finite";
                log->warn("chart {} not updated: {}", chart.id(), report.message);
                stamp();
                return report;
            }
        }
    }

    for (Element* e : elements) {
        session.write_back(e->attributes());
        const auto& attrs = e->attributes();
        for (const auto& d : attrs.schema().attributes()) {
            if (d.kind != chart_model::AttributeKind::Number || !d.default_range) continue;
            const double v = attrs.get(d.name);
            if (chart_model::in_default_range(d, v)) continue;
            report.hints.push_back({ e->id(), d.name, v, d.default_range->first, d.default_range->second });
            log->warn("{}.{} = {} is outside its default range [{}, {}]", e->id(), d.name, v,
                d.default_range->first, d.default_range->second);
        }
    }

    stamp();
    log->debug("solved chart {}: {} elements, {} variables, {} constraints, {} blocks in {:.3f} ms",
        chart.id(), report.element_count, report.variable_count, report.constraint_count, report.block_count,
        report.elapsed_ms);
    return report;
}

} // namespace chart_layout
