#include <chart_elements/catalog.hpp>
#include <chart_elements/builtin_classes.hpp>
#include <chart_model/unique_id.hpp>
#include <chart_solver/log.hpp>

namespace chart_elements {

UnknownClassError::UnknownClassError(const std::string& class_id)
    : std::out_of_range("unknown element class '" + class_id + "'")
{
}

DuplicateClassError::DuplicateClassError(const std::string& class_id)
    : std::invalid_argument("element class '" + class_id + "' is already registered")
{
}

CatalogFrozenError::CatalogFrozenError(const std::string& class_id)
    : std::logic_error("cannot register '" + class_id + "': catalog is frozen")
{
}

const ElementClass& Catalog::register_class(std::unique_ptr<ElementClass> element_class) {
    if (!element_class) throw std::invalid_argument("cannot register a null element class");
    const std::string id = element_class->class_id();
    if (frozen_) throw CatalogFrozenError(id);
    if (classes_.count(id)) throw DuplicateClassError(id);

    const ElementClass& registered = *element_class;
    classes_.emplace(id, std::move(element_class));
    chart_solver::logger()->debug("registered element class {}", id);
    return registered;
}

const ElementClass* Catalog::find(const std::string& class_id) const {
    const auto it = classes_.find(class_id);
    return it == classes_.end() ? nullptr : it->second.get();
}

const ElementClass& Catalog::get(const std::string& class_id) const {
    const ElementClass* c = find(class_id);
    if (!c) throw UnknownClassError(class_id);
    return *c;
}

namespace {

template <typename T>
const T& get_typed(const Catalog& catalog, const std::string& class_id, ElementType expected) {
    const ElementClass& c = catalog.get(class_id);
    if (c.element_type() != expected) {
        throw std::invalid_argument("element class '" + class_id + "' is a " + to_string(c.element_type())
            + " class, not a " + to_string(expected) + " class");
    }
    return static_cast<const T&>(c);
}

} // namespace

const MarkClass& Catalog::get_mark_class(const std::string& class_id) const {
    return get_typed<MarkClass>(*this, class_id, ElementType::Mark);
}

const GlyphClass& Catalog::get_glyph_class(const std::string& class_id) const {
    return get_typed<GlyphClass>(*this, class_id, ElementType::Glyph);
}

const ChartClass& Catalog::get_chart_class(const std::string& class_id) const {
    return get_typed<ChartClass>(*this, class_id, ElementType::Chart);
}

std::vector<std::string> Catalog::class_ids() const {
    std::vector<std::string> out;
    out.reserve(classes_.size());
    for (const auto& kv : classes_) out.push_back(kv.first);
    return out;
}

Catalog& global_catalog() {
    static Catalog catalog;
    return catalog;
}

Mark create_mark(const Catalog& catalog, const std::string& class_id) {
    Mark mark(catalog.get_mark_class(class_id), chart_model::unique_id(to_string(ElementType::Mark)));
    mark.initialize_state();
    return mark;
}

Glyph create_glyph(const Catalog& catalog, const std::string& class_id, const std::string& table) {
    Glyph glyph(catalog.get_glyph_class(class_id), chart_model::unique_id(to_string(ElementType::Glyph)), table);
    glyph.initialize_state();
    glyph.add_mark(create_mark(catalog, class_ids::anchor_mark));
    return glyph;
}

Chart create_chart(const Catalog& catalog, const std::string& class_id) {
    Chart chart(catalog.get_chart_class(class_id), chart_model::unique_id(to_string(ElementType::Chart)));
    chart.initialize_state();
    return chart;
}

} // namespace chart_elements
