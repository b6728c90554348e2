#include "classes.hpp"
#include <chart_elements/builtin_classes.hpp>
#include <chart_elements/element.hpp>
#include <chart_elements/solve_session.hpp>
#include <string>

namespace chart_elements::classes {

namespace {

using chart_model::AttributeKind;
using chart_model::intrinsic;
using chart_model::positional;
using chart_model::typed;
using chart_solver::ConstraintStrength;

class RectMark final : public MarkClass {
public:
    RectMark()
        : MarkClass(class_ids::rect_mark, "Rectangle",
            {
                positional("x1"),
                positional("y1"),
                positional("x2"),
                positional("y2"),
                positional("cx"),
                positional("cy"),
                intrinsic("width", "Width", { 0.0, 400.0 }),
                intrinsic("height", "Height", { 0.0, 400.0 }),
                typed("fill", AttributeKind::Text, "Fill"),
                typed("visible", AttributeKind::Boolean, "Visible"),
            })
    {
    }

    void initialize_state(chart_model::AttributeMap& attrs) const override {
        const double width = 40.0;
        const double height = 60.0;
        attrs.set("width", width);
        attrs.set("height", height);
        attrs.set("x1", -width / 2);
        attrs.set("x2", width / 2);
        attrs.set("y1", -height / 2);
        attrs.set("y2", height / 2);
        attrs.set("cx", 0.0);
        attrs.set("cy", 0.0);
        attrs.set_value("fill", std::string("#17becf"));
        attrs.set_value("visible", true);
    }

    void build_intrinsic_constraints(SolveSession& session, const Mark& mark) const override {
        const auto& attrs = mark.attributes();
        const auto x1 = session.attr(attrs, "x1");
        const auto y1 = session.attr(attrs, "y1");
        const auto x2 = session.attr(attrs, "x2");
        const auto y2 = session.attr(attrs, "y2");
        const auto cx = session.attr(attrs, "cx");
        const auto cy = session.attr(attrs, "cy");
        const auto width = session.attr(attrs, "width");
        const auto height = session.attr(attrs, "height");

        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, x2 }, { -1.0, x1 } }, { { 1.0, width } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, y2 }, { -1.0, y1 } }, { { 1.0, height } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 2.0, cx } }, { { 1.0, x1 }, { 1.0, x2 } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 2.0, cy } }, { { 1.0, y1 }, { 1.0, y2 } });
        session.add_soft_inequality(ConstraintStrength::Strong, 0, { { 1.0, width } });
        session.add_soft_inequality(ConstraintStrength::Strong, 0, { { 1.0, height } });
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

    // Edge handles only span the rectangle itself.
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

std::unique_ptr<MarkClass> make_rect_mark() {
    return std::make_unique<RectMark>();
}

} // namespace chart_elements::classes
