#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace chart_solver {

// Strength of a constraint. Hard constraints hold exactly; soft tiers are
// relaxed in order, strongest first.
enum class ConstraintStrength {
    Hard,
    Strong,
    Medium,
    Weak,
    Weaker
};

// Strength of the "stay" pulling a variable toward its seed value.
enum class VariableStrength {
    None,
    Weaker,
    Weak,
    Medium,
    Strong
};

// Soft tiers in the order they are resolved.
inline constexpr std::array<ConstraintStrength, 4> soft_tiers = {
    ConstraintStrength::Strong,
    ConstraintStrength::Medium,
    ConstraintStrength::Weak,
    ConstraintStrength::Weaker,
};

inline constexpr bool is_soft(ConstraintStrength s) {
    return s != ConstraintStrength::Hard;
}

// Tier a variable's stay is resolved at; empty for VariableStrength::None.
inline constexpr std::optional<ConstraintStrength> stay_tier(VariableStrength s) {
    switch (s) {
    case VariableStrength::Strong: return ConstraintStrength::Strong;
    case VariableStrength::Medium: return ConstraintStrength::Medium;
    case VariableStrength::Weak: return ConstraintStrength::Weak;
    case VariableStrength::Weaker: return ConstraintStrength::Weaker;
    case VariableStrength::None: break;
    }
    return std::nullopt;
}

inline constexpr std::string_view to_string(ConstraintStrength s) {
    switch (s) {
    case ConstraintStrength::Hard: return "hard";
    case ConstraintStrength::Strong: return "strong";
    case ConstraintStrength::Medium: return "medium";
    case ConstraintStrength::Weak: return "weak";
    case ConstraintStrength::Weaker: return "weaker";
    }
    return "unknown";
}

inline constexpr std::string_view to_string(VariableStrength s) {
    switch (s) {
    case VariableStrength::None: return "none";
    case VariableStrength::Weaker: return "weaker";
    case VariableStrength::Weak: return "weak";
    case VariableStrength::Medium: return "medium";
    case VariableStrength::Strong: return "strong";
    }
    return "unknown";
}

} // namespace chart_solver
