#include <chart_config/config_loader.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace chart_config {

namespace {

std::optional<LayoutConfig> parse_layout_config_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    LayoutConfig out = default_layout_config();

    if (j.contains("solver")) {
        const auto& s = j["solver"];
        if (!s.is_object()) return std::nullopt;
        if (s.contains("tolerance") && s["tolerance"].is_number())
            out.solver.tolerance = s["tolerance"].get<double>();
        if (s.contains("rank_threshold") && s["rank_threshold"].is_number())
            out.solver.rank_threshold = s["rank_threshold"].get<double>();
        if (s.contains("max_inequality_passes") && s["max_inequality_passes"].is_number_integer())
            out.solver.max_inequality_passes = s["max_inequality_passes"].get<int>();
    }
    if (out.solver.tolerance <= 0 || out.solver.rank_threshold <= 0 || out.solver.max_inequality_passes < 1)
        return std::nullopt;

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        if (!l.is_object()) return std::nullopt;
        out.logging.level = l.contains("level") && l["level"].is_string() ? l["level"].get<std::string>() : out.logging.level;
        out.logging.file = l.contains("file") && l["file"].is_string() ? l["file"].get<std::string>() : out.logging.file;
        out.logging.pattern = l.contains("pattern") && l["pattern"].is_string()
            ? l["pattern"].get<std::string>() : out.logging.pattern;
    }

    return out;
}

} // namespace

LayoutConfig default_layout_config() {
    return LayoutConfig{};
}

std::optional<LayoutConfig> load_layout_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_layout_config_json(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<LayoutConfig> load_layout_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_layout_config_from_json(f);
}

std::optional<double> parse_number_argument(const std::string& text) {
    try {
        std::size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(value)) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<int> parse_count_argument(const std::string& text) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace chart_config
