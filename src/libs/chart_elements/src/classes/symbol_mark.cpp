#include "classes.hpp"
#include <chart_elements/builtin_classes.hpp>
#include <chart_elements/element.hpp>
#include <chart_elements/solve_session.hpp>
#include <string>

namespace chart_elements::classes {

namespace {

using chart_solver::ConstraintStrength;

// Point symbol; size is the symbol's area.
class SymbolMark final : public MarkClass {
public:
    SymbolMark()
        : MarkClass(class_ids::symbol_mark, "Symbol",
            {
                chart_model::positional("x"),
                chart_model::positional("y"),
                chart_model::intrinsic("size", "Size", { 0.0, 3600.0 }),
                chart_model::typed("symbol", chart_model::AttributeKind::Text, "Shape"),
            })
    {
    }

    void initialize_state(chart_model::AttributeMap& attrs) const override {
        attrs.set("x", 0.0);
        attrs.set("y", 0.0);
        attrs.set("size", 60.0);
        attrs.set_value("symbol", std::string("circle"));
    }

    void build_intrinsic_constraints(SolveSession& session, const Mark& mark) const override {
        session.add_soft_inequality(ConstraintStrength::Strong, 0,
            { { 1.0, session.attr(mark.attributes(), "size") } });
    }

    std::vector<SnappingGuide> alignment_guides(const chart_model::AttributeMap& attrs) const override {
        return {
            { Axis::X, attrs.get("x"), "x", true },
            { Axis::Y, attrs.get("y"), "y", true },
        };
    }

    std::vector<Handle> handles(const chart_model::AttributeMap& attrs) const override {
        return { PointHandle{ attrs.get("x"), attrs.get("y"), "x", "y" } };
    }
};

} // namespace

std::unique_ptr<MarkClass> make_symbol_mark() {
    return std::make_unique<SymbolMark>();
}

} // namespace chart_elements::classes
