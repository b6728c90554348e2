#include <chart_solver/constraint_solver.hpp>
#include <chart_solver/log.hpp>
#include <Eigen/OrderingMethods>
#include <Eigen/SparseCholesky>
#include <Eigen/SparseCore>
#include <Eigen/SparseQR>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <stdexcept>

namespace chart_solver {

namespace {

using Eigen::VectorXd;
using SparseMatrix = Eigen::SparseMatrix<double>;
using Triplet = Eigen::Triplet<double>;

double max_abs(const SparseMatrix& m) {
    return m.nonZeros() == 0 ? 0.0 : m.coeffs().abs().maxCoeff();
}

// Lexicographic least squares over one block of coupled variables. Each stage
// moves the solution only along the directions every earlier stage left free.
// The free directions are kept as the columns of a sparse orthonormal basis,
// so a stage only factorizes the directions its rows actually touch.
class StagedSolve {
public:
    StagedSolve(const VectorXd& seed, double rank_threshold)
        : x_(seed)
        , free_(seed.size(), seed.size())
        , rank_threshold_(rank_threshold)
    {
        free_.setIdentity();
    }

    // Minimum-norm least-squares step toward m * x = r, then restricts the free
    // directions to the null space of m.
    void stage(const SparseMatrix& m, const VectorXd& r) {
        if (m.rows() == 0 || free_.cols() == 0) return;

        SparseMatrix projected = m * free_;
        const double cutoff = rank_threshold_ * std::max(1.0, max_abs(m));
        // Rows already fixed by stronger stages project to rounding noise.
        projected.prune([cutoff](Eigen::Index, Eigen::Index, double value) { return std::abs(value) > cutoff; });
        if (projected.nonZeros() == 0) return;

        // Factor the transpose of the touched part: rows are free directions,
        // columns are stage rows. Untouched directions stay free as they are.
        std::vector<Eigen::Index> used_rows;
        std::vector<Eigen::Index> used_cols;
        std::vector<Eigen::Index> row_slot(static_cast<std::size_t>(projected.rows()), -1);
        std::vector<Eigen::Index> col_slot(static_cast<std::size_t>(projected.cols()), -1);
        std::vector<Triplet> entries;
        entries.reserve(static_cast<std::size_t>(projected.nonZeros()));
        for (Eigen::Index c = 0; c < projected.outerSize(); ++c) {
            for (SparseMatrix::InnerIterator it(projected, c); it; ++it) {
                auto& cs = col_slot[static_cast<std::size_t>(c)];
                if (cs < 0) {
                    cs = static_cast<Eigen::Index>(used_cols.size());
                    used_cols.push_back(c);
                }
                auto& rs = row_slot[static_cast<std::size_t>(it.row())];
                if (rs < 0) {
                    rs = static_cast<Eigen::Index>(used_rows.size());
                    used_rows.push_back(it.row());
                }
                entries.emplace_back(cs, rs, it.value());
            }
        }
        const auto p = static_cast<Eigen::Index>(used_cols.size());
        const auto q = static_cast<Eigen::Index>(used_rows.size());
        SparseMatrix transposed(p, q);
        transposed.setFromTriplets(entries.begin(), entries.end());
        transposed.makeCompressed();

        // transposed * P = Q * R
        Eigen::SparseQR<SparseMatrix, Eigen::COLAMDOrdering<int>> qr;
        qr.setPivotThreshold(rank_threshold_ * std::max(1.0, max_abs(transposed)));
        qr.compute(transposed);
        if (qr.info() != Eigen::Success)
            throw std::runtime_error("chart_solver: sparse factorization failed: " + qr.lastErrorMessage());
        const Eigen::Index rank = qr.rank();
        if (rank == 0) return;

        const SparseMatrix upper = qr.matrixR().topRows(rank);
        const SparseMatrix gram = upper * upper.transpose();
        Eigen::SimplicialLDLT<SparseMatrix> normal(gram);
        if (normal.info() != Eigen::Success)
            throw std::runtime_error("chart_solver: stage normal equations are singular");

        // The touched system is P * R' * Q' * u = s; with y = Q' * u only the
        // first `rank` entries of y reach the residual, the rest stay zero.
        auto step = [&]() {
            const VectorXd residual = r - m * x_;
            VectorXd touched(q);
            for (Eigen::Index i = 0; i < q; ++i) touched[i] = residual[used_rows[static_cast<std::size_t>(i)]];
            const VectorXd permuted = qr.colsPermutation().transpose() * touched;
            VectorXd y = VectorXd::Zero(p);
            y.head(rank) = normal.solve(upper * permuted);
            const VectorXd u = qr.matrixQ() * y;
            for (Eigen::Index j = 0; j < p; ++j) {
                if (u[j] == 0.0) continue;
                for (SparseMatrix::InnerIterator it(free_, used_cols[static_cast<std::size_t>(j)]); it; ++it)
                    x_[it.row()] += it.value() * u[j];
            }
        };
        step();
        // One refinement pass recovers the digits lost to large seeds.
        step();

        std::vector<Triplet> basis;
        Eigen::Index next = 0;
        for (Eigen::Index c = 0; c < free_.cols(); ++c) {
            if (col_slot[static_cast<std::size_t>(c)] >= 0) continue;
            for (SparseMatrix::InnerIterator it(free_, c); it; ++it) basis.emplace_back(it.row(), next, it.value());
            ++next;
        }
        VectorXd unit = VectorXd::Zero(p);
        VectorXd column(x_.size());
        const double drop = std::numeric_limits<double>::epsilon();
        for (Eigen::Index j = rank; j < p; ++j) {
            unit.setZero();
            unit[j] = 1.0;
            const VectorXd q_column = qr.matrixQ() * unit;
            column.setZero();
            for (Eigen::Index i = 0; i < p; ++i) {
                if (q_column[i] == 0.0) continue;
                for (SparseMatrix::InnerIterator it(free_, used_cols[static_cast<std::size_t>(i)]); it; ++it)
                    column[it.row()] += it.value() * q_column[i];
            }
            for (Eigen::Index i = 0; i < column.size(); ++i) {
                if (std::abs(column[i]) > drop) basis.emplace_back(i, next, column[i]);
            }
            ++next;
        }
        SparseMatrix updated(x_.size(), next);
        updated.setFromTriplets(basis.begin(), basis.end());
        free_ = std::move(updated);
    }

    const VectorXd& solution() const { return x_; }

private:
    VectorXd x_;
    SparseMatrix free_;
    double rank_threshold_;
};

} // namespace

ConstraintSolver::ConstraintSolver(SolverOptions options)
    : options_(options)
{
}

Variable ConstraintSolver::new_variable(double initial, VariableStrength strength) {
    if (!std::isfinite(initial))
        throw std::invalid_argument("chart_solver: variable seed must be finite");
    VariableState state;
    state.value = initial;
    state.strength = strength;
    variables_.push_back(state);
    return Variable{ variables_.size() - 1 };
}

void ConstraintSolver::check_variable(Variable v) const {
    if (v.index >= variables_.size())
        throw std::out_of_range("chart_solver: variable handle does not belong to this solver");
}

std::size_t ConstraintSolver::add_row(ConstraintStrength strength, bool inequality, double constant,
    const std::vector<Term>& lhs, const std::vector<Term>& rhs)
{
    if (!std::isfinite(constant))
        throw std::invalid_argument("chart_solver: constraint constant must be finite");

    // Ordered so that identical inputs always produce identical rows.
    std::map<std::size_t, double> merged;
    for (const auto& [coefficient, v] : lhs) {
        check_variable(v);
        merged[v.index] += coefficient;
    }
    for (const auto& [coefficient, v] : rhs) {
        check_variable(v);
        merged[v.index] -= coefficient;
    }

    Row row;
    row.strength = strength;
    row.inequality = inequality;
    row.constant = constant;
    for (const auto& [index, coefficient] : merged) {
        if (!std::isfinite(coefficient))
            throw std::invalid_argument("chart_solver: constraint coefficient must be finite");
        if (coefficient != 0.0) row.coefficients.emplace_back(index, coefficient);
    }
    rows_.push_back(std::move(row));
    return rows_.size() - 1;
}

std::size_t ConstraintSolver::add_linear(ConstraintStrength strength, double constant,
    const std::vector<Term>& lhs, const std::vector<Term>& rhs)
{
    return add_row(strength, false, constant, lhs, rhs);
}

std::size_t ConstraintSolver::add_soft_inequality(ConstraintStrength strength, double constant,
    const std::vector<Term>& lhs, const std::vector<Term>& rhs)
{
    if (!is_soft(strength))
        throw std::invalid_argument("chart_solver: inequalities must use a soft strength");
    return add_row(strength, true, constant, lhs, rhs);
}

std::size_t ConstraintSolver::add_equals(ConstraintStrength strength, Variable a, Variable b) {
    return add_row(strength, false, 0.0, { { 1.0, a } }, { { 1.0, b } });
}

std::size_t ConstraintSolver::make_constant(Variable v) {
    check_variable(v);
    return add_row(ConstraintStrength::Hard, false, variables_[v.index].value, { { 1.0, v } }, {});
}

double ConstraintSolver::value(Variable v) const {
    check_variable(v);
    return variables_[v.index].value;
}

void ConstraintSolver::set_value(Variable v, double value) {
    check_variable(v);
    if (!std::isfinite(value))
        throw std::invalid_argument("chart_solver: variable value must be finite");
    variables_[v.index].value = value;
}

VariableStrength ConstraintSolver::strength(Variable v) const {
    check_variable(v);
    return variables_[v.index].strength;
}

std::vector<ConstraintSolver::Block> ConstraintSolver::partition() const {
    const std::size_t n = variables_.size();
    std::vector<std::size_t> parent(n);
    std::iota(parent.begin(), parent.end(), std::size_t{ 0 });

    auto find = [&parent](std::size_t v) {
        while (parent[v] != v) {
            parent[v] = parent[parent[v]];
            v = parent[v];
        }
        return v;
    };

    for (const auto& row : rows_) {
        if (row.coefficients.empty()) continue;
        const std::size_t first = find(row.coefficients.front().first);
        for (std::size_t i = 1; i < row.coefficients.size(); ++i) {
            const std::size_t other = find(row.coefficients[i].first);
            if (other == first) continue;
            // Smaller index stays the root so block order follows variable order.
            if (other < first) parent[first] = other;
            else parent[other] = first;
        }
    }

    std::vector<Block> blocks;
    std::vector<std::size_t> block_of(n, n);
    for (std::size_t v = 0; v < n; ++v) {
        const std::size_t root = find(v);
        if (block_of[root] == n) {
            block_of[root] = blocks.size();
            blocks.emplace_back();
        }
        blocks[block_of[root]].variables.push_back(v);
    }
    for (std::size_t r = 0; r < rows_.size(); ++r) {
        if (rows_[r].coefficients.empty()) continue;
        blocks[block_of[find(rows_[r].coefficients.front().first)]].rows.push_back(r);
    }
    return blocks;
}


bool ConstraintSolver::row_satisfied(const Row& row, double activity, double magnitude) const {
    const double slack = options_.tolerance * (1.0 + std::abs(row.constant) + magnitude);
    if (row.inequality) return activity >= row.constant - slack;
    return std::abs(activity - row.constant) <= slack;
}

SolveResult ConstraintSolver::solve() {
    SolveResult result;

    for (std::size_t r = 0; r < rows_.size(); ++r) {
        const Row& row = rows_[r];
        if (!row.coefficients.empty() || row.strength != ConstraintStrength::Hard || row.inequality) continue;
        if (!row_satisfied(row, 0.0, 0.0)) result.violated_constraints.push_back(r);
    }

    const std::vector<Block> blocks = partition();
    result.block_count = blocks.size();

    std::vector<double> solved(variables_.size());
    for (std::size_t v = 0; v < variables_.size(); ++v) solved[v] = variables_[v].value;
    std::vector<std::size_t> local(variables_.size(), 0);

    for (const Block& block : blocks) {
        if (!result.violated_constraints.empty()) break;
        if (block.rows.empty()) continue;

        const auto k = static_cast<Eigen::Index>(block.variables.size());
        VectorXd seed(k);
        for (Eigen::Index i = 0; i < k; ++i) {
            const std::size_t v = block.variables[static_cast<std::size_t>(i)];
            local[v] = static_cast<std::size_t>(i);
            seed[i] = variables_[v].value;
        }

        std::vector<std::size_t> hard;
        std::map<ConstraintStrength, std::vector<std::size_t>> equalities;
        std::vector<std::size_t> inequalities;
        for (std::size_t r : block.rows) {
            const Row& row = rows_[r];
            if (row.inequality) inequalities.push_back(r);
            else if (row.strength == ConstraintStrength::Hard) hard.push_back(r);
            else equalities[row.strength].push_back(r);
        }

        auto build = [&](const std::vector<std::size_t>& ids, SparseMatrix& m, VectorXd& rhs) {
            std::vector<Triplet> entries;
            m.resize(static_cast<Eigen::Index>(ids.size()), k);
            rhs = VectorXd::Zero(static_cast<Eigen::Index>(ids.size()));
            for (std::size_t i = 0; i < ids.size(); ++i) {
                const Row& row = rows_[ids[i]];
                for (const auto& [index, coefficient] : row.coefficients)
                    entries.emplace_back(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(local[index]), coefficient);
                rhs[static_cast<Eigen::Index>(i)] = row.constant;
            }
            m.setFromTriplets(entries.begin(), entries.end());
        };

        // Returns the row's activity at x; `magnitude` receives sum |coefficient * x|.
        auto activity = [&](const Row& row, const VectorXd& x, double& magnitude) {
            double sum = 0.0;
            magnitude = 0.0;
            for (const auto& [index, coefficient] : row.coefficients) {
                const double term = coefficient * x[static_cast<Eigen::Index>(local[index])];
                sum += term;
                magnitude += std::abs(term);
            }
            return sum;
        };

        auto satisfied = [&](const Row& row, const VectorXd& x) {
            double magnitude = 0.0;
            const double a = activity(row, x, magnitude);
            return row_satisfied(row, a, magnitude);
        };

        std::vector<char> active(inequalities.size(), 0);
        VectorXd x = seed;
        int passes = 0;
        for (;;) {
            StagedSolve staged(seed, options_.rank_threshold);
            SparseMatrix m;
            VectorXd rhs;

            build(hard, m, rhs);
            staged.stage(m, rhs);
            if (passes == 0) {
                for (std::size_t r : hard) {
                    if (!satisfied(rows_[r], staged.solution())) result.violated_constraints.push_back(r);
                }
                if (!result.violated_constraints.empty()) break;
            }

            for (ConstraintStrength tier : soft_tiers) {
                std::vector<std::size_t> ids;
                if (const auto it = equalities.find(tier); it != equalities.end()) ids = it->second;
                for (std::size_t i = 0; i < inequalities.size(); ++i) {
                    if (active[i] && rows_[inequalities[i]].strength == tier) ids.push_back(inequalities[i]);
                }
                build(ids, m, rhs);
                staged.stage(m, rhs);

                std::vector<Triplet> stays;
                VectorXd targets(k);
                for (Eigen::Index i = 0; i < k; ++i) {
                    if (stay_tier(variables_[block.variables[static_cast<std::size_t>(i)]].strength) != tier) continue;
                    const auto slot = static_cast<Eigen::Index>(stays.size());
                    stays.emplace_back(slot, i, 1.0);
                    targets[slot] = seed[i];
                }
                if (!stays.empty()) {
                    const auto count = static_cast<Eigen::Index>(stays.size());
                    m.resize(count, k);
                    m.setFromTriplets(stays.begin(), stays.end());
                    rhs = targets.head(count);
                    staged.stage(m, rhs);
                }
            }

            x = staged.solution();
            ++passes;

            // Active set: release inequalities the solution moved strictly inside
            // their bound, then enforce the single most violated one.
            bool changed = false;
            std::size_t worst = inequalities.size();
            double worst_violation = 0.0;
            for (std::size_t i = 0; i < inequalities.size(); ++i) {
                const Row& row = rows_[inequalities[i]];
                double magnitude = 0.0;
                const double a = activity(row, x, magnitude);
                const double slack = options_.tolerance * (1.0 + std::abs(row.constant) + magnitude);
                if (active[i]) {
                    if (a > row.constant + slack) {
                        active[i] = 0;
                        changed = true;
                    }
                    continue;
                }
                if (row_satisfied(row, a, magnitude)) continue;
                double norm = 0.0;
                for (const auto& term : row.coefficients) norm += term.second * term.second;
                const double violation = (row.constant - a) / std::sqrt(norm);
                if (worst == inequalities.size() || violation > worst_violation) {
                    worst = i;
                    worst_violation = violation;
                }
            }
            if (worst < inequalities.size()) {
                active[worst] = 1;
                changed = true;
            }
            if (!changed) break;
            if (passes >= options_.max_inequality_passes) {
                logger()->warn("soft inequalities still violated after {} passes", passes);
                break;
            }
        }

        if (!result.violated_constraints.empty()) break;
        result.inequality_passes = std::max(result.inequality_passes, passes);
        for (Eigen::Index i = 0; i < k; ++i)
            solved[block.variables[static_cast<std::size_t>(i)]] = x[i];
    }

    if (!result.violated_constraints.empty()) {
        result.status = SolveStatus::Infeasible;
        result.message = "hard constraints are inconsistent ("
            + std::to_string(result.violated_constraints.size()) + " equations violated)";
        logger()->warn("solve failed: {}", result.message);
        return result;
    }

    for (std::size_t v = 0; v < variables_.size(); ++v) variables_[v].value = solved[v];
    logger()->debug("solved {} variables, {} constraints in {} blocks",
        variables_.size(), rows_.size(), result.block_count);
    return result;
}

} // namespace chart_solver
