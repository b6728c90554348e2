#include <chart_elements/builtin_classes.hpp>
#include "classes/classes.hpp"

namespace chart_elements {

namespace {

template <typename Make>
void register_missing(Catalog& catalog, const char* class_id, Make make) {
    if (catalog.contains(class_id)) return;
    catalog.register_class(make());
}

} // namespace

void register_builtin_classes(Catalog& catalog) {
    register_missing(catalog, class_ids::anchor_mark, classes::make_anchor_mark);
    register_missing(catalog, class_ids::rect_mark, classes::make_rect_mark);
    register_missing(catalog, class_ids::symbol_mark, classes::make_symbol_mark);
    register_missing(catalog, class_ids::rectangle_glyph, classes::make_rectangle_glyph);
    register_missing(catalog, class_ids::rectangle_chart, classes::make_rectangle_chart);
}

} // namespace chart_elements
