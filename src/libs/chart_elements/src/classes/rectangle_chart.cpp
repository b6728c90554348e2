#include "classes.hpp"
#include <chart_elements/builtin_classes.hpp>
#include <chart_elements/element.hpp>
#include <chart_elements/solve_session.hpp>

namespace chart_elements::classes {

namespace {

using chart_model::intrinsic;
using chart_model::positional;
using chart_solver::ConstraintStrength;

// Chart canvas centered on the origin. (x1, y1, x2, y2) is the plot area left
// after the margins.
class RectangleChart final : public ChartClass {
public:
    RectangleChart()
        : ChartClass(class_ids::rectangle_chart, "Chart",
            {
                intrinsic("width", "Width", { 100.0, 4000.0 }),
                intrinsic("height", "Height", { 100.0, 4000.0 }),
                intrinsic("margin_left", "Left", { 0.0, 500.0 }, chart_solver::VariableStrength::Weaker, "margins"),
                intrinsic("margin_right", "Right", { 0.0, 500.0 }, chart_solver::VariableStrength::Weaker, "margins"),
                intrinsic("margin_top", "Top", { 0.0, 500.0 }, chart_solver::VariableStrength::Weaker, "margins"),
                intrinsic("margin_bottom", "Bottom", { 0.0, 500.0 }, chart_solver::VariableStrength::Weaker, "margins"),
                positional("x1"),
                positional("y1"),
                positional("x2"),
                positional("y2"),
                positional("cx"),
                positional("cy"),
            })
    {
    }

    void initialize_state(chart_model::AttributeMap& attrs) const override {
        const double width = 900.0;
        const double height = 600.0;
        const double margin = 50.0;
        attrs.set("width", width);
        attrs.set("height", height);
        attrs.set("margin_left", margin);
        attrs.set("margin_right", margin);
        attrs.set("margin_top", margin);
        attrs.set("margin_bottom", margin);
        attrs.set("x1", -width / 2 + margin);
        attrs.set("x2", width / 2 - margin);
        attrs.set("y1", -height / 2 + margin);
        attrs.set("y2", height / 2 - margin);
        attrs.set("cx", 0.0);
        attrs.set("cy", 0.0);
    }

    void build_intrinsic_constraints(SolveSession& session, const Chart& chart) const override {
        const auto& attrs = chart.attributes();
        const auto width = session.attr(attrs, "width");
        const auto height = session.attr(attrs, "height");
        const auto margin_left = session.attr(attrs, "margin_left");
        const auto margin_right = session.attr(attrs, "margin_right");
        const auto margin_top = session.attr(attrs, "margin_top");
        const auto margin_bottom = session.attr(attrs, "margin_bottom");
        const auto x1 = session.attr(attrs, "x1");
        const auto y1 = session.attr(attrs, "y1");
        const auto x2 = session.attr(attrs, "x2");
        const auto y2 = session.attr(attrs, "y2");
        const auto cx = session.attr(attrs, "cx");
        const auto cy = session.attr(attrs, "cy");

        session.add_linear(ConstraintStrength::Hard, 0, { { 2.0, x1 } }, { { -1.0, width }, { 2.0, margin_left } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 2.0, x2 } }, { { 1.0, width }, { -2.0, margin_right } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 2.0, y1 } }, { { -1.0, height }, { 2.0, margin_bottom } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 2.0, y2 } }, { { 1.0, height }, { -2.0, margin_top } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 2.0, cx } }, { { 1.0, x1 }, { 1.0, x2 } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 2.0, cy } }, { { 1.0, y1 }, { 1.0, y2 } });
    }

    std::vector<SnappingGuide> alignment_guides(const chart_model::AttributeMap& attrs) const override {
        return {
            { Axis::X, attrs.get("x1"), "x1", true },
            { Axis::X, attrs.get("cx"), "cx", true },
            { Axis::X, attrs.get("x2"), "x2", true },
            { Axis::Y, attrs.get("y1"), "y1", true },
            { Axis::Y, attrs.get("cy"), "cy", true },
            { Axis::Y, attrs.get("y2"), "y2", true },
        };
    }

    std::vector<Handle> handles(const chart_model::AttributeMap& attrs) const override {
        const std::pair<double, double> x_extent{ attrs.get("x1"), attrs.get("x2") };
        const std::pair<double, double> y_extent{ attrs.get("y1"), attrs.get("y2") };
        return {
            LineHandle{ Axis::X, attrs.get("x1"), y_extent, "x1" },
            LineHandle{ Axis::X, attrs.get("x2"), y_extent, "x2" },
            LineHandle{ Axis::Y, attrs.get("y1"), x_extent, "y1" },
            LineHandle{ Axis::Y, attrs.get("y2"), x_extent, "y2" },
        };
    }
};

} // namespace

std::unique_ptr<ChartClass> make_rectangle_chart() {
    return std::make_unique<RectangleChart>();
}

} // namespace chart_elements::classes
