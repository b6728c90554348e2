#include "classes.hpp"
#include <chart_elements/builtin_classes.hpp>
#include <chart_elements/element.hpp>
#include <chart_elements/solve_session.hpp>

namespace chart_elements::classes {

namespace {

using chart_model::intrinsic;
using chart_model::positional;
using chart_solver::ConstraintStrength;
using chart_solver::Term;

// Glyph with a bounding box (x1, y1, x2, y2) placed at (x, y) and an intrinsic
// frame (ix1, iy1, ix2, iy2) of the same size centered on the glyph origin.
class RectangleGlyph final : public GlyphClass {
public:
    RectangleGlyph()
        : GlyphClass(class_ids::rectangle_glyph, "Glyph",
            {
                positional("x1"),
                positional("y1"),
                positional("x2"),
                positional("y2"),
                positional("x"),
                positional("y"),
                intrinsic("width", "Width", { 30.0, 200.0 }),
                intrinsic("height", "Height", { 30.0, 200.0 }),
                positional("ix1"),
                positional("iy1"),
                positional("ix2"),
                positional("iy2"),
                positional("icx"),
                positional("icy"),
            })
    {
    }

    void initialize_state(chart_model::AttributeMap& attrs) const override {
        const double x = 0.0;
        const double y = 0.0;
        const double width = 60.0;
        const double height = 100.0;
        attrs.set("x", x);
        attrs.set("y", y);
        attrs.set("width", width);
        attrs.set("height", height);
        attrs.set("x1", x - width / 2);
        attrs.set("y1", y - height / 2);
        attrs.set("x2", x + width / 2);
        attrs.set("y2", y + height / 2);
        attrs.set("ix1", -width / 2);
        attrs.set("iy1", -height / 2);
        attrs.set("ix2", +width / 2);
        attrs.set("iy2", +height / 2);
        attrs.set("icx", 0.0);
        attrs.set("icy", 0.0);
    }

    void build_intrinsic_constraints(SolveSession& session, const Glyph& glyph) const override {
        const auto& attrs = glyph.attributes();
        const auto x1 = session.attr(attrs, "x1");
        const auto y1 = session.attr(attrs, "y1");
        const auto x2 = session.attr(attrs, "x2");
        const auto y2 = session.attr(attrs, "y2");
        const auto x = session.attr(attrs, "x");
        const auto y = session.attr(attrs, "y");
        const auto width = session.attr(attrs, "width");
        const auto height = session.attr(attrs, "height");
        const auto ix1 = session.attr(attrs, "ix1");
        const auto iy1 = session.attr(attrs, "iy1");
        const auto ix2 = session.attr(attrs, "ix2");
        const auto iy2 = session.attr(attrs, "iy2");
        const auto icx = session.attr(attrs, "icx");
        const auto icy = session.attr(attrs, "icy");

        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, x2 }, { -1.0, x1 } }, { { 1.0, width } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, y2 }, { -1.0, y1 } }, { { 1.0, height } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, ix2 }, { -1.0, ix1 } }, { { 1.0, width } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, iy2 }, { -1.0, iy1 } }, { { 1.0, height } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, ix1 }, { 1.0, ix2 } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, iy1 }, { 1.0, iy2 } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, icx } });
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, icy } });

        // The glyph center is the box midpoint shifted by the anchor mark.
        std::vector<Term> center_x = { { 0.5, x2 }, { 0.5, x1 } };
        std::vector<Term> center_y = { { 0.5, y2 }, { 0.5, y1 } };
        if (glyph.mark_count() > 0) {
            const auto& anchor = glyph.mark(0).attributes();
            center_x.emplace_back(1.0, session.attr(anchor, "x"));
            center_y.emplace_back(1.0, session.attr(anchor, "y"));
        }
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, x } }, center_x);
        session.add_linear(ConstraintStrength::Hard, 0, { { 1.0, y } }, center_y);
    }

    std::vector<SnappingGuide> alignment_guides(const chart_model::AttributeMap& attrs) const override {
        return {
            { Axis::X, attrs.get("ix1"), "ix1", true },
            { Axis::X, attrs.get("ix2"), "ix2", true },
            { Axis::X, attrs.get("icx"), "icx", true },
            { Axis::Y, attrs.get("iy1"), "iy1", true },
            { Axis::Y, attrs.get("iy2"), "iy2", true },
            { Axis::Y, attrs.get("icy"), "icy", true },
        };
    }

    std::vector<Handle> handles(const chart_model::AttributeMap& attrs) const override {
        const std::pair<double, double> inf{ -unbounded_span, unbounded_span };
        return {
            LineHandle{ Axis::X, attrs.get("ix1"), inf, "ix1" },
            LineHandle{ Axis::X, attrs.get("ix2"), inf, "ix2" },
            LineHandle{ Axis::Y, attrs.get("iy1"), inf, "iy1" },
            LineHandle{ Axis::Y, attrs.get("iy2"), inf, "iy2" },
        };
    }
};

} // namespace

std::unique_ptr<GlyphClass> make_rectangle_glyph() {
    return std::make_unique<RectangleGlyph>();
}

} // namespace chart_elements::classes
