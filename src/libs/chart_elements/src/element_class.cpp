#include <chart_elements/element_class.hpp>

namespace chart_elements {

const char* to_string(ElementType type) {
    switch (type) {
    case ElementType::Mark: return "mark";
    case ElementType::Glyph: return "glyph";
    case ElementType::Chart: return "chart";
    }
    return "unknown";
}

ElementClass::ElementClass(std::string class_id, ElementType type, std::string display_name,
    std::vector<chart_model::AttributeDescription> attributes)
    : class_id_(std::move(class_id))
    , type_(type)
    , display_name_(std::move(display_name))
    , schema_(class_id_, std::move(attributes))
{
}

MarkClass::MarkClass(std::string class_id, std::string display_name,
    std::vector<chart_model::AttributeDescription> attributes)
    : ElementClass(std::move(class_id), ElementType::Mark, std::move(display_name), std::move(attributes))
{
}

GlyphClass::GlyphClass(std::string class_id, std::string display_name,
    std::vector<chart_model::AttributeDescription> attributes)
    : ElementClass(std::move(class_id), ElementType::Glyph, std::move(display_name), std::move(attributes))
{
}

ChartClass::ChartClass(std::string class_id, std::string display_name,
    std::vector<chart_model::AttributeDescription> attributes)
    : ElementClass(std::move(class_id), ElementType::Chart, std::move(display_name), std::move(attributes))
{
}

} // namespace chart_elements
