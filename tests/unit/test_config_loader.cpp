#include <chart_config/config_loader.hpp>
#include <chart_config/logging.hpp>
#include <chart_solver/log.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace chart_config;

namespace {

std::optional<LayoutConfig> load(const std::string& text) {
    std::istringstream in(text);
    return load_layout_config_from_json(in);
}

} // namespace

// ─── Loader ──────────────────────────────────────────────────────────────────

TEST(ConfigLoader, ReadsEverySection)
{
    const auto config = load(R"({
        "solver": { "tolerance": 1e-7, "rank_threshold": 1e-12, "max_inequality_passes": 4 },
        "logging": { "level": "debug", "file": "logs/layout.log", "pattern": "%v" }
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->solver.tolerance, 1e-7);
    EXPECT_DOUBLE_EQ(config->solver.rank_threshold, 1e-12);
    EXPECT_EQ(config->solver.max_inequality_passes, 4);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_EQ(config->logging.file, "logs/layout.log");
    EXPECT_EQ(config->logging.pattern, "%v");
}

TEST(ConfigLoader, MissingKeysKeepDefaults)
{
    const auto config = load(R"({ "solver": { "tolerance": 1e-6 } })");
    ASSERT_TRUE(config.has_value());
    const LayoutConfig defaults = default_layout_config();
    EXPECT_DOUBLE_EQ(config->solver.tolerance, 1e-6);
    EXPECT_DOUBLE_EQ(config->solver.rank_threshold, defaults.solver.rank_threshold);
    EXPECT_EQ(config->solver.max_inequality_passes, defaults.solver.max_inequality_passes);
    EXPECT_EQ(config->logging.level, "info");
    EXPECT_TRUE(config->logging.file.empty());

    const auto empty = load("{}");
    ASSERT_TRUE(empty.has_value());
    EXPECT_DOUBLE_EQ(empty->solver.tolerance, defaults.solver.tolerance);
}

TEST(ConfigLoader, WrongValueTypesAreIgnored)
{
    const auto config = load(R"({ "solver": { "tolerance": "tight", "max_inequality_passes": 2.5 },
                                  "logging": { "level": 3 } })");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->solver.tolerance, 1e-9);
    EXPECT_EQ(config->solver.max_inequality_passes, 16);
    EXPECT_EQ(config->logging.level, "info");
}

TEST(ConfigLoader, RejectsMalformedInput)
{
    EXPECT_FALSE(load("{ \"solver\": ").has_value());
    EXPECT_FALSE(load("[1, 2, 3]").has_value());
    EXPECT_FALSE(load(R"({ "solver": 5 })").has_value());
    EXPECT_FALSE(load(R"({ "logging": "debug" })").has_value());
}

TEST(ConfigLoader, RejectsOutOfRangeSolverOptions)
{
    EXPECT_FALSE(load(R"({ "solver": { "tolerance": 0 } })").has_value());
    EXPECT_FALSE(load(R"({ "solver": { "rank_threshold": -1e-10 } })").has_value());
    EXPECT_FALSE(load(R"({ "solver": { "max_inequality_passes": 0 } })").has_value());
}

TEST(ConfigLoader, MissingFile)
{
    EXPECT_FALSE(load_layout_config_from_json_file("/nonexistent/chart_layout.json").has_value());
}

TEST(ConfigLoader, ReadsFile)
{
    const auto path = std::filesystem::temp_directory_path() / "chart_constraints_config_test.json";
    {
        std::ofstream out(path);
        out << R"({ "logging": { "level": "warn" } })";
    }
    const auto config = load_layout_config_from_json_file(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->logging.level, "warn");
}

// ─── Command-line values ─────────────────────────────────────────────────────

TEST(Arguments, ParsesWholeNumbers)
{
    EXPECT_DOUBLE_EQ(parse_number_argument("80").value_or(0.0), 80.0);
    EXPECT_DOUBLE_EQ(parse_number_argument("-12.5").value_or(0.0), -12.5);
    EXPECT_DOUBLE_EQ(parse_number_argument("1e3").value_or(0.0), 1000.0);
    EXPECT_EQ(parse_count_argument("200").value_or(0), 200);
    EXPECT_EQ(parse_count_argument("-3").value_or(0), -3);
}

TEST(Arguments, RejectsMalformedNumbers)
{
    EXPECT_FALSE(parse_number_argument("abc").has_value());
    EXPECT_FALSE(parse_number_argument("").has_value());
    EXPECT_FALSE(parse_number_argument("12px").has_value());
    EXPECT_FALSE(parse_number_argument("1e999").has_value());
    EXPECT_FALSE(parse_number_argument("nan").has_value());
    EXPECT_FALSE(parse_count_argument("abc").has_value());
    EXPECT_FALSE(parse_count_argument("2.5").has_value());
    EXPECT_FALSE(parse_count_argument("99999999999").has_value());
}

// ─── Logging ─────────────────────────────────────────────────────────────────

TEST(Logging, ParsesLevelNames)
{
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_EQ(parse_log_level("loud"), spdlog::level::info);
}

TEST(Logging, FileLoggerReplacesSharedLogger)
{
    const auto dir = std::filesystem::temp_directory_path() / "chart_constraints_log_test";
    std::filesystem::remove_all(dir);

    LoggingConfig config;
    config.level = "debug";
    config.file = (dir / "nested" / "layout.log").string();
    auto logger = configure_logging(config);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), chart_solver::logger_name);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    EXPECT_EQ(chart_solver::logger(), logger);

    logger->flush();
    EXPECT_TRUE(std::filesystem::exists(config.file));

    spdlog::drop(chart_solver::logger_name);
    logger.reset();
    std::filesystem::remove_all(dir);
}

TEST(Logging, UncreatableDirectoryFallsBackToDefaultLogger)
{
    const auto blocker = std::filesystem::temp_directory_path() / "chart_constraints_log_blocker";
    std::filesystem::remove_all(blocker);
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    LoggingConfig config;
    config.file = (blocker / "nested" / "layout.log").string();
    std::shared_ptr<spdlog::logger> logger;
    EXPECT_NO_THROW(logger = configure_logging(config));
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger, spdlog::default_logger());
    EXPECT_FALSE(std::filesystem::exists(config.file));

    std::filesystem::remove(blocker);
}
