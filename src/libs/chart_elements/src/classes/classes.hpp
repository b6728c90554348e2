#pragma once

#include <chart_elements/element_class.hpp>
#include <memory>

namespace chart_elements::classes {

std::unique_ptr<MarkClass> make_anchor_mark();
std::unique_ptr<MarkClass> make_rect_mark();
std::unique_ptr<MarkClass> make_symbol_mark();
std::unique_ptr<GlyphClass> make_rectangle_glyph();
std::unique_ptr<ChartClass> make_rectangle_chart();

} // namespace chart_elements::classes
