#pragma once

#include <chart_config/config_loader.hpp>
#include <spdlog/spdlog.h>
#include <memory>

namespace chart_config {

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off";
// anything else maps to info.
spdlog::level::level_enum parse_log_level(const std::string& level);

// Replaces the shared chart_layout logger with one built from `config`: a file
// logger (parent directories created) when config.file is set, a colored
// stderr logger otherwise. Falls back to the default logger on failure.
std::shared_ptr<spdlog::logger> configure_logging(const LoggingConfig& config);

} // namespace chart_config
