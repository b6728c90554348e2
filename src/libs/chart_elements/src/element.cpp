#include <chart_elements/element.hpp>
#include <chart_model/errors.hpp>
#include <chart_model/unique_id.hpp>

namespace chart_elements {

UninitializedElementError::UninitializedElementError(const std::string& element_id)
    : std::logic_error("element '" + element_id + "' has no state; initialize_state() was not called")
{
}

Element::Element(const ElementClass& element_class, std::string id)
    : id_(std::move(id))
    , class_(&element_class)
{
}

void Element::initialize_state() {
    if (attributes_) throw std::logic_error("element '" + id_ + "' is already initialized");

    chart_model::AttributeMap attrs(class_->schema());
    class_->initialize_state(attrs);
    if (!attrs.is_complete()) throw chart_model::IncompleteStateError(class_->class_id(), attrs.missing());
    attributes_.emplace(std::move(attrs));
}

const chart_model::AttributeMap& Element::attributes() const {
    if (!attributes_) throw UninitializedElementError(id_);
    return *attributes_;
}

chart_model::AttributeMap& Element::attributes() {
    if (!attributes_) throw UninitializedElementError(id_);
    return *attributes_;
}

std::vector<SnappingGuide> Element::alignment_guides() const {
    return class_->alignment_guides(attributes());
}

std::vector<Handle> Element::handles() const {
    return class_->handles(attributes());
}

Mark::Mark(const MarkClass& mark_class, std::string id)
    : Element(mark_class, std::move(id))
    , mark_class_(&mark_class)
{
}

Mark Mark::clone() const {
    Mark copy = *this;
    copy.reassign_id(chart_model::unique_id(to_string(ElementType::Mark)));
    return copy;
}

Glyph::Glyph(const GlyphClass& glyph_class, std::string id, std::string table)
    : Element(glyph_class, std::move(id))
    , glyph_class_(&glyph_class)
    , table_(std::move(table))
{
}

Mark& Glyph::add_mark(Mark mark) {
    marks_.push_back(std::move(mark));
    return marks_.back();
}

Glyph Glyph::clone() const {
    Glyph copy = *this;
    copy.reassign_id(chart_model::unique_id(to_string(ElementType::Glyph)));
    for (auto& m : copy.marks_) m = m.clone();
    return copy;
}

Chart::Chart(const ChartClass& chart_class, std::string id)
    : Element(chart_class, std::move(id))
    , chart_class_(&chart_class)
{
}

Glyph& Chart::add_glyph(Glyph glyph) {
    glyphs_.push_back(std::move(glyph));
    return glyphs_.back();
}

} // namespace chart_elements
