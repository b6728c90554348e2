#pragma once

#include <chart_elements/catalog.hpp>
#include <chart_elements/element.hpp>
#include <chart_layout/external_constraints.hpp>
#include <chart_solver/constraint_solver.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace chart_layout {

class UnknownElementError : public std::out_of_range {
public:
    explicit UnknownElementError(const std::string& element_id);

    const std::string& element_id() const { return element_id_; }

private:
    std::string element_id_;
};

// An intrinsic attribute solved outside its advisory default range.
struct OutOfRangeHint {
    std::string element_id;
    std::string attribute;
    double value = 0.0;
    double low = 0.0;
    double high = 0.0;
};

struct SolveReport {
    chart_solver::SolveStatus status = chart_solver::SolveStatus::Solved;
    std::string message;
    std::vector<OutOfRangeHint> hints;
    std::size_t element_count = 0;
    std::size_t variable_count = 0;
    std::size_t constraint_count = 0;
    std::size_t block_count = 0;
    double elapsed_ms = 0.0;

    bool ok() const { return status == chart_solver::SolveStatus::Solved; }
};

// Solves a whole chart: every instance's intrinsic constraints plus the
// external constraints, in one session. Results are applied all-or-nothing.
class SolveOrchestrator {
public:
    // Freezes `catalog`; no class can be registered once solving begins.
    explicit SolveOrchestrator(chart_solver::SolverOptions options = {},
        chart_elements::Catalog& catalog = chart_elements::global_catalog());

    // On Infeasible no attribute of `chart` is modified. Throws
    // UnknownElementError / chart_model::UnknownAttributeError for bad external
    // references and chart_elements::UninitializedElementError for instances
    // without state, before anything is solved.
    SolveReport solve(chart_elements::Chart& chart,
        const std::vector<ExternalConstraint>& constraints = {}) const;

    const chart_solver::SolverOptions& options() const { return options_; }

private:
    chart_solver::SolverOptions options_;
};

} // namespace chart_layout
