#pragma once

#include <chart_solver/constraint_solver.hpp>
#include <istream>
#include <optional>
#include <string>

namespace chart_config {

struct LoggingConfig {
    std::string level = "info";
    // Empty: log to stderr.
    std::string file;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
};

struct LayoutConfig {
    chart_solver::SolverOptions solver;
    LoggingConfig logging;
};

LayoutConfig default_layout_config();

std::optional<LayoutConfig> load_layout_config_from_json(std::istream& in);
std::optional<LayoutConfig> load_layout_config_from_json_file(const std::string& path);

// Command-line values. The whole string must be a finite number; anything
// else (empty, trailing text, out of range) gives nullopt.
std::optional<double> parse_number_argument(const std::string& text);
std::optional<int> parse_count_argument(const std::string& text);

} // namespace chart_config
