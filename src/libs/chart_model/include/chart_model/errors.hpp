#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace chart_model {

// Attribute name outside the owning class's schema.
class UnknownAttributeError : public std::out_of_range {
public:
    UnknownAttributeError(const std::string& attribute, const std::string& owner);

    const std::string& attribute() const { return attribute_; }
    const std::string& owner() const { return owner_; }

private:
    std::string attribute_;
    std::string owner_;
};

// Read or write with a value of the wrong kind (number / boolean / text).
class AttributeKindError : public std::invalid_argument {
public:
    explicit AttributeKindError(const std::string& attribute, const std::string& expected,
        const std::string& actual);
};

// A default-state initializer left schema attributes unassigned.
class IncompleteStateError : public std::logic_error {
public:
    IncompleteStateError(const std::string& owner, const std::vector<std::string>& missing);

    const std::vector<std::string>& missing() const { return missing_; }

private:
    std::vector<std::string> missing_;
};

} // namespace chart_model
