// Chart solve driver: builds a chart of rectangle glyphs, solves it and logs
// the solved attributes, guides and handles.
#include <chart_config/config_loader.hpp>
#include <chart_config/logging.hpp>
#include <chart_elements/builtin_classes.hpp>
#include <chart_elements/catalog.hpp>
#include <chart_layout/orchestrator.hpp>
#include <cstdio>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

void log_element(spdlog::logger& log, const chart_elements::Element& element) {
    const auto& attrs = element.attributes();
    std::string line;
    for (const auto& d : attrs.schema().attributes()) {
        if (d.kind != chart_model::AttributeKind::Number) continue;
        line += fmt::format(" {}={:.3f}", d.name, attrs.get(d.name));
    }
    log.info("{} [{}]{}", element.id(), element.class_id(), line);

    for (const auto& g : element.alignment_guides()) {
        log.debug("  guide {} {}={:.3f}", g.axis == chart_elements::Axis::X ? "x" : "y", g.attribute, g.value);
    }
    for (const auto& h : element.handles()) {
        std::visit([&log](const auto& handle) {
            using T = std::decay_t<decltype(handle)>;
            if constexpr (std::is_same_v<T, chart_elements::LineHandle>) {
                log.debug("  line handle {} {}={:.3f} span=[{}, {}]",
                    handle.axis == chart_elements::Axis::X ? "x" : "y", handle.attribute, handle.value,
                    handle.span.first, handle.span.second);
            } else {
                log.debug("  point handle ({}, {})=({:.3f}, {:.3f})",
                    handle.x_attribute, handle.y_attribute, handle.x, handle.y);
            }
        }, h);
    }
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<std::string> config_path;
    int glyph_count = 3;
    std::optional<double> width;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--glyphs" && i + 1 < argc) {
            const auto count = chart_config::parse_count_argument(argv[++i]);
            if (!count) {
                (void)fprintf(stderr, "invalid value for --glyphs: %s\n", argv[i]);
                return 1;
            }
            glyph_count = *count;
        } else if (arg == "--width" && i + 1 < argc) {
            width = chart_config::parse_number_argument(argv[++i]);
            if (!width) {
                (void)fprintf(stderr, "invalid value for --width: %s\n", argv[i]);
                return 1;
            }
        } else {
            (void)fprintf(stderr, "usage: %s [--config file.json] [--glyphs N] [--width W]\n", argv[0]);
            return 1;
        }
    }
    if (glyph_count < 1) {
        (void)fprintf(stderr, "--glyphs must be at least 1\n");
        return 1;
    }

    chart_config::LayoutConfig config = chart_config::default_layout_config();
    if (config_path) {
        auto loaded = chart_config::load_layout_config_from_json_file(*config_path);
        if (!loaded) {
            (void)fprintf(stderr, "cannot load config from %s\n", config_path->c_str());
            return 1;
        }
        config = std::move(*loaded);
    }
    auto log = chart_config::configure_logging(config.logging);

    chart_elements::Catalog& catalog = chart_elements::global_catalog();
    chart_elements::register_builtin_classes(catalog);
    const chart_layout::SolveOrchestrator orchestrator(config.solver, catalog);

    namespace ids = chart_elements::class_ids;
    chart_elements::Chart chart = chart_elements::create_chart(catalog, ids::rectangle_chart);
    for (int i = 0; i < glyph_count; ++i) {
        chart_elements::Glyph glyph = chart_elements::create_glyph(catalog, ids::rectangle_glyph, "main");
        glyph.add_mark(chart_elements::create_mark(catalog, ids::rect_mark));
        glyph.add_mark(chart_elements::create_mark(catalog, ids::symbol_mark));
        chart.add_glyph(std::move(glyph));
    }

    std::vector<chart_layout::ExternalConstraint> constraints;
    const double spacing = 100.0;
    const auto& first = chart.glyph(0);
    for (std::size_t i = 0; i < chart.glyph_count(); ++i) {
        const auto& glyph = chart.glyph(i);
        constraints.push_back(chart_layout::pin({ glyph.id(), "x" }, static_cast<double>(i) * spacing,
            chart_solver::ConstraintStrength::Medium));
        if (i > 0) constraints.push_back(chart_layout::align({ first.id(), "y" }, { glyph.id(), "y" }));
        // The rect mark fills the glyph's intrinsic frame.
        const auto& rect = glyph.mark(1);
        constraints.push_back(chart_layout::align({ rect.id(), "x1" }, { glyph.id(), "ix1" },
            chart_solver::ConstraintStrength::Hard));
        constraints.push_back(chart_layout::align({ rect.id(), "x2" }, { glyph.id(), "ix2" },
            chart_solver::ConstraintStrength::Hard));
        if (width) constraints.push_back(chart_layout::pin({ glyph.id(), "width" }, *width));
    }

    const chart_layout::SolveReport report = orchestrator.solve(chart, constraints);
    if (!report.ok()) {
        log->error("solve failed: {}", report.message);
        return 2;
    }

    log->info("solved {} elements ({} variables, {} constraints, {} blocks) in {:.3f} ms",
        report.element_count, report.variable_count, report.constraint_count, report.block_count,
        report.elapsed_ms);
    for (const auto& hint : report.hints) {
        log->info("hint: {}.{} = {:.3f} outside [{}, {}]", hint.element_id, hint.attribute, hint.value,
            hint.low, hint.high);
    }

    log_element(*log, chart);
    for (const auto& glyph : chart.glyphs()) {
        log_element(*log, glyph);
        for (const auto& mark : glyph.marks()) log_element(*log, mark);
    }
    return 0;
}
