#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace chart_solver {

// Name of the logger shared by the solver, the element classes and the
// orchestrator. chart_config::configure_logging replaces it.
inline constexpr const char* logger_name = "chart_layout";

// Registered logger with logger_name, created on first use with a stderr sink.
// Falls back to spdlog's default logger if it cannot be created.
std::shared_ptr<spdlog::logger> logger();

} // namespace chart_solver
