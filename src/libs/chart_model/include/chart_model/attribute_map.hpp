#pragma once

#include <chart_model/attributes.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace chart_model {

// Values of one instance's attributes, keyed by the names of its class schema.
// The schema is owned by the class and outlives every map built from it.
class AttributeMap {
public:
    explicit AttributeMap(const AttributeSchema& schema);

    // Numeric access. Throws UnknownAttributeError or AttributeKindError.
    double get(const std::string& name) const;
    void set(const std::string& name, double value);

    // Typed access, no coercion between kinds.
    const AttributeValue& value(const std::string& name) const;
    void set_value(const std::string& name, const AttributeValue& value);

    double number_at(std::size_t index) const;
    void set_number_at(std::size_t index, double value);

    bool contains(const std::string& name) const { return schema_->contains(name); }
    bool is_assigned(const std::string& name) const;
    bool is_complete() const;
    std::vector<std::string> missing() const;

    const AttributeSchema& schema() const { return *schema_; }

private:
    std::size_t index_for(const std::string& name) const;
    void assign(std::size_t index, const AttributeValue& value);

    const AttributeSchema* schema_;
    std::vector<AttributeValue> values_;
    std::vector<char> assigned_;
};

} // namespace chart_model
