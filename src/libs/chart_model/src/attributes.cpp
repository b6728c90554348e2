#include <chart_model/attributes.hpp>
#include <chart_model/errors.hpp>
#include <stdexcept>

namespace chart_model {

AttributeDescription positional(std::string name) {
    AttributeDescription d;
    d.name = std::move(name);
    d.kind = AttributeKind::Number;
    d.role = AttributeRole::Positional;
    d.strength = chart_solver::VariableStrength::None;
    return d;
}

AttributeDescription intrinsic(std::string name, std::string display_name,
    std::pair<double, double> default_range, chart_solver::VariableStrength strength, std::string category)
{
    AttributeDescription d;
    d.name = std::move(name);
    d.kind = AttributeKind::Number;
    d.role = AttributeRole::Intrinsic;
    d.strength = strength;
    d.default_range = default_range;
    d.display_name = std::move(display_name);
    d.category = std::move(category);
    return d;
}

AttributeDescription typed(std::string name, AttributeKind kind, std::string display_name, std::string category) {
    AttributeDescription d;
    d.name = std::move(name);
    d.kind = kind;
    d.role = AttributeRole::Intrinsic;
    d.display_name = std::move(display_name);
    d.category = std::move(category);
    return d;
}

AttributeKind kind_of(const AttributeValue& value) {
    if (std::holds_alternative<bool>(value)) return AttributeKind::Boolean;
    if (std::holds_alternative<std::string>(value)) return AttributeKind::Text;
    return AttributeKind::Number;
}

const char* to_string(AttributeKind kind) {
    switch (kind) {
    case AttributeKind::Number: return "number";
    case AttributeKind::Boolean: return "boolean";
    case AttributeKind::Text: return "text";
    }
    return "unknown";
}

bool in_default_range(const AttributeDescription& description, double value) {
    if (!description.default_range) return true;
    return value >= description.default_range->first && value <= description.default_range->second;
}

AttributeSchema::AttributeSchema(std::string owner, std::vector<AttributeDescription> attributes)
    : owner_(std::move(owner))
    , attributes_(std::move(attributes))
{
    for (std::size_t i = 0; i < attributes_.size(); ++i) {
        if (!index_.emplace(attributes_[i].name, i).second)
            throw std::invalid_argument(owner_ + ": duplicate attribute '" + attributes_[i].name + "'");
    }
}

std::optional<std::size_t> AttributeSchema::index_of(const std::string& name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::size_t AttributeSchema::require(const std::string& name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) throw UnknownAttributeError(name, owner_);
    return it->second;
}

const AttributeDescription& AttributeSchema::describe(const std::string& name) const {
    return attributes_[require(name)];
}

std::vector<std::string> AttributeSchema::names() const {
    std::vector<std::string> out;
    out.reserve(attributes_.size());
    for (const auto& a : attributes_) out.push_back(a.name);
    return out;
}

} // namespace chart_model
