#include <chart_solver/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chart_solver {

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(logger_name)) return existing;

    try {
        auto created = spdlog::stderr_color_mt(logger_name);
        created->set_level(spdlog::level::warn);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
        return created;
    } catch (const spdlog::spdlog_ex&) {
        // Lost a registration race or the sink failed to open.
        if (auto existing = spdlog::get(logger_name)) return existing;
        return spdlog::default_logger();
    }
}

} // namespace chart_solver
