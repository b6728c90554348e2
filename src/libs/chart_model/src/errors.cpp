#include <chart_model/errors.hpp>

namespace chart_model {

namespace {

std::string join(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

UnknownAttributeError::UnknownAttributeError(const std::string& attribute, const std::string& owner)
    : std::out_of_range("unknown attribute '" + attribute + "' for " + (owner.empty() ? "element" : owner))
    , attribute_(attribute)
    , owner_(owner)
{
}

AttributeKindError::AttributeKindError(const std::string& attribute, const std::string& expected,
    const std::string& actual)
    : std::invalid_argument("attribute '" + attribute + "' holds " + expected + ", got " + actual)
{
}

IncompleteStateError::IncompleteStateError(const std::string& owner, const std::vector<std::string>& missing)
    : std::logic_error(owner + " left attributes unassigned: " + join(missing))
    , missing_(missing)
{
}

} // namespace chart_model
