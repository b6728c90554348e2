#pragma once

#include <chart_elements/catalog.hpp>

namespace chart_elements {

namespace class_ids {

inline constexpr const char* anchor_mark = "mark.anchor";
inline constexpr const char* rect_mark = "mark.rect";
inline constexpr const char* symbol_mark = "mark.symbol";
inline constexpr const char* rectangle_glyph = "glyph.rectangle";
inline constexpr const char* rectangle_chart = "chart.rectangle";

} // namespace class_ids

// Registers every built-in class that the catalog does not hold yet.
// Calling it again is a no-op.
void register_builtin_classes(Catalog& catalog);

} // namespace chart_elements
