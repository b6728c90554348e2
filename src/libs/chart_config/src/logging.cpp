#include <chart_config/logging.hpp>
#include <chart_solver/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>

namespace chart_config {

spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> configure_logging(const LoggingConfig& config) {
    spdlog::drop(chart_solver::logger_name);

    std::shared_ptr<spdlog::logger> logger;
    try {
        if (!config.file.empty()) {
            const std::filesystem::path log_file(config.file);
            if (log_file.has_parent_path()) std::filesystem::create_directories(log_file.parent_path());
            logger = spdlog::basic_logger_mt(chart_solver::logger_name, log_file.string(), true);
        } else {
            logger = spdlog::stderr_color_mt(chart_solver::logger_name);
        }
        logger->set_level(parse_log_level(config.level));
        logger->flush_on(spdlog::level::warn);
        logger->set_pattern(config.pattern);
        logger->info("Logger initialized. level={} file={}", config.level,
            config.file.empty() ? "<stderr>" : config.file);
    } catch (const spdlog::spdlog_ex& e) {
        logger = spdlog::default_logger();
        logger->warn("could not create {} logger: {}", chart_solver::logger_name, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        logger = spdlog::default_logger();
        logger->warn("could not create log directory for {}: {}", config.file, e.what());
    }
    return logger;
}

} // namespace chart_config
