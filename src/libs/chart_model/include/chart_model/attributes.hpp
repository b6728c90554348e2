#pragma once

#include <chart_solver/strength.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace chart_model {

enum class AttributeKind {
    Number,
    Boolean,
    Text
};

enum class AttributeRole {
    Positional, // derived by the solver, always exact
    Intrinsic,  // meaningful on its own; may carry a default range and a stay
    Computed
};

using AttributeValue = std::variant<double, bool, std::string>;

struct AttributeDescription {
    std::string name;
    AttributeKind kind = AttributeKind::Number;
    AttributeRole role = AttributeRole::Positional;
    chart_solver::VariableStrength strength = chart_solver::VariableStrength::None;
    // Advisory range; values outside it produce hints, never failures.
    std::optional<std::pair<double, double>> default_range;
    std::string display_name;
    std::string category;
};

AttributeDescription positional(std::string name);
AttributeDescription intrinsic(std::string name, std::string display_name,
    std::pair<double, double> default_range,
    chart_solver::VariableStrength strength = chart_solver::VariableStrength::Weaker,
    std::string category = "dimensions");
AttributeDescription typed(std::string name, AttributeKind kind, std::string display_name,
    std::string category = "style");

AttributeKind kind_of(const AttributeValue& value);
const char* to_string(AttributeKind kind);

bool in_default_range(const AttributeDescription& description, double value);

// Ordered, immutable list of the attributes a class declares.
class AttributeSchema {
public:
    AttributeSchema() = default;
    AttributeSchema(std::string owner, std::vector<AttributeDescription> attributes);

    const std::string& owner() const { return owner_; }
    const std::vector<AttributeDescription>& attributes() const { return attributes_; }
    std::size_t size() const { return attributes_.size(); }
    const AttributeDescription& at(std::size_t index) const { return attributes_.at(index); }

    std::optional<std::size_t> index_of(const std::string& name) const;
    // Throws UnknownAttributeError.
    std::size_t require(const std::string& name) const;
    const AttributeDescription& describe(const std::string& name) const;
    bool contains(const std::string& name) const { return index_.count(name) != 0; }

    std::vector<std::string> names() const;

private:
    std::string owner_;
    std::vector<AttributeDescription> attributes_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace chart_model
