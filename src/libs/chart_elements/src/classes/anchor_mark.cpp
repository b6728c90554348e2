#include "classes.hpp"
#include <chart_elements/builtin_classes.hpp>
#include <chart_elements/element.hpp>

namespace chart_elements::classes {

namespace {

// Reference point of a glyph. Its position offsets the glyph center.
class AnchorMark final : public MarkClass {
public:
    AnchorMark()
        : MarkClass(class_ids::anchor_mark, "Anchor",
            { chart_model::positional("x"), chart_model::positional("y") })
    {
    }

    void initialize_state(chart_model::AttributeMap& attrs) const override {
        attrs.set("x", 0.0);
        attrs.set("y", 0.0);
    }

    void build_intrinsic_constraints(SolveSession&, const Mark&) const override {}

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

std::unique_ptr<MarkClass> make_anchor_mark() {
    return std::make_unique<AnchorMark>();
}

} // namespace chart_elements::classes
