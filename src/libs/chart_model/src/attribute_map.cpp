#include <chart_model/attribute_map.hpp>
#include <chart_model/errors.hpp>
#include <cmath>
#include <stdexcept>

namespace chart_model {

namespace {

AttributeValue zero_value(AttributeKind kind) {
    switch (kind) {
    case AttributeKind::Boolean: return false;
    case AttributeKind::Text: return std::string();
    case AttributeKind::Number: break;
    }
    return 0.0;
}

} // namespace

AttributeMap::AttributeMap(const AttributeSchema& schema)
    : schema_(&schema)
    , assigned_(schema.size(), 0)
{
    values_.reserve(schema.size());
    for (const auto& d : schema.attributes()) values_.push_back(zero_value(d.kind));
}

std::size_t AttributeMap::index_for(const std::string& name) const {
    return schema_->require(name);
}

double AttributeMap::get(const std::string& name) const {
    return number_at(index_for(name));
}

void AttributeMap::set(const std::string& name, double value) {
    set_number_at(index_for(name), value);
}

const AttributeValue& AttributeMap::value(const std::string& name) const {
    return values_[index_for(name)];
}

void AttributeMap::set_value(const std::string& name, const AttributeValue& value) {
    const std::size_t index = index_for(name);
    if (const double* number = std::get_if<double>(&value)) {
        set_number_at(index, *number);
        return;
    }
    assign(index, value);
}

double AttributeMap::number_at(std::size_t index) const {
    const AttributeDescription& d = schema_->at(index);
    if (d.kind != AttributeKind::Number)
        throw AttributeKindError(d.name, to_string(d.kind), to_string(AttributeKind::Number));
    return std::get<double>(values_[index]);
}

void AttributeMap::set_number_at(std::size_t index, double value) {
    if (!std::isfinite(value))
        throw std::invalid_argument("attribute '" + schema_->at(index).name + "' must be finite");
    assign(index, value);
}

void AttributeMap::assign(std::size_t index, const AttributeValue& value) {
    const AttributeDescription& d = schema_->at(index);
    const AttributeKind actual = kind_of(value);
    if (actual != d.kind) throw AttributeKindError(d.name, to_string(d.kind), to_string(actual));
    values_[index] = value;
    assigned_[index] = 1;
}

bool AttributeMap::is_assigned(const std::string& name) const {
    return assigned_[index_for(name)] != 0;
}

bool AttributeMap::is_complete() const {
    for (char a : assigned_) {
        if (!a) return false;
    }
    return true;
}

std::vector<std::string> AttributeMap::missing() const {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < assigned_.size(); ++i) {
        if (!assigned_[i]) out.push_back(schema_->at(i).name);
    }
    return out;
}

} // namespace chart_model
