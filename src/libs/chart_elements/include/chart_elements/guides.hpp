#pragma once

#include <string>
#include <utility>
#include <variant>

namespace chart_elements {

enum class Axis {
    X,
    Y
};

// Finite stand-in for an unbounded handle span.
inline constexpr double unbounded_span = 10000.0;

// Axis-aligned snapping line at a solved coordinate.
struct SnappingGuide {
    Axis axis = Axis::X;
    double value = 0.0;
    std::string attribute;
    bool visible = true;
};

// Draggable line perpendicular to `axis`, positioned at `value` and spanning
// [span.first, span.second] along the other axis.
struct LineHandle {
    Axis axis = Axis::X;
    double value = 0.0;
    std::pair<double, double> span{ -unbounded_span, unbounded_span };
    std::string attribute;
};

// Draggable point writing two attributes at once.
struct PointHandle {
    double x = 0.0;
    double y = 0.0;
    std::string x_attribute;
    std::string y_attribute;
};

using Handle = std::variant<LineHandle, PointHandle>;

} // namespace chart_elements
