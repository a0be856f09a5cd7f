#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"
#include "paircorr_log.hpp"
#include <algorithm>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace paircorr {

namespace {

// Squared minimum-image distance between particles i and j
inline double periodic_distance2(const double* a, const double* b, const Box& box) {
    double r2 = 0.0;
    for (size_t d = 0; d < box.dim(); ++d) {
        const double L = box.lengths[d];
        double dx = b[d] - a[d];
        dx -= L * std::round(dx / L);
        r2 += dx * dx;
    }
    return r2;
}

inline int wrap_cell(int c, int n) {
    int res = c % n;
    return res < 0 ? res + n : res;
}

/**
 * Periodic linked-cell list. Every cell is at least rmax wide and there
 * are at least 3 cells per axis, so the 3^dim stencil around a cell
 * visits distinct cells and covers every neighbor within rmax.
 */
class CellList {
public:
    CellList(const std::vector<double>& wrapped, size_t n, const Box& box, const std::array<int, 3>& ncell)
        : box_(box), ncell_(ncell), next_(n, -1)
    {
        const size_t dim = box.dim();
        for (size_t d = 0; d < 3; ++d) {
            inv_width_[d] = d < dim ? ncell_[d] / box.lengths[d] : 0.0;
        }
        head_.assign(static_cast<size_t>(ncell_[0]) * ncell_[1] * ncell_[2], -1);

        for (size_t i = 0; i < n; ++i) {
            std::array<int, 3> c = cell_of(wrapped.data() + i * dim);
            const size_t idx = index(c[0], c[1], c[2]);
            next_[i] = head_[idx];
            head_[idx] = static_cast<long>(i);
        }
    }

    std::array<int, 3> cell_of(const double* p) const {
        std::array<int, 3> c = {0, 0, 0};
        for (size_t d = 0; d < box_.dim(); ++d) {
            int k = static_cast<int>(std::floor(p[d] * inv_width_[d]));
            c[d] = std::max(0, std::min(k, ncell_[d] - 1));
        }
        return c;
    }

    size_t index(int i, int j, int k) const {
        return (static_cast<size_t>(i) * ncell_[1] + j) * ncell_[2] + k;
    }

    long head(size_t cell) const { return head_[cell]; }
    long next(size_t i) const { return next_[i]; }
    const std::array<int, 3>& ncell() const { return ncell_; }

private:
    const Box& box_;
    std::array<int, 3> ncell_;
    std::array<double, 3> inv_width_ = {0.0, 0.0, 0.0};
    std::vector<long> head_;
    std::vector<long> next_;
};

void neighbors_cell_list(
    const std::vector<double>& wrapped,
    size_t n,
    const Box& box,
    double rmax,
    const std::array<int, 3>& ncell,
    std::vector<std::vector<size_t>>& neighbors
) {
    const size_t dim = box.dim();
    const double rmax2 = rmax * rmax;
    CellList cells(wrapped, n, box, ncell);

    // Collapsed third axis in 2D
    const int kspan = dim == 3 ? 1 : 0;

    #pragma omp parallel for schedule(dynamic, 64)
    for (long ii = 0; ii < static_cast<long>(n); ++ii) {
        const size_t i = static_cast<size_t>(ii);
        const double* pi = wrapped.data() + i * dim;
        const std::array<int, 3> c = cells.cell_of(pi);

        for (int di = -1; di <= 1; ++di) {
            for (int dj = -1; dj <= 1; ++dj) {
                for (int dk = -kspan; dk <= kspan; ++dk) {
                    const size_t cell = cells.index(
                        wrap_cell(c[0] + di, ncell[0]),
                        wrap_cell(c[1] + dj, ncell[1]),
                        wrap_cell(c[2] + dk, ncell[2]));

                    for (long j = cells.head(cell); j > -1; j = cells.next(j)) {
                        if (static_cast<size_t>(j) <= i) continue;
                        if (periodic_distance2(pi, wrapped.data() + j * dim, box) < rmax2) {
                            neighbors[i].push_back(static_cast<size_t>(j));
                        }
                    }
                }
            }
        }
        std::sort(neighbors[i].begin(), neighbors[i].end());
    }
}

void neighbors_brute_force(
    const std::vector<double>& wrapped,
    size_t n,
    const Box& box,
    double rmax,
    std::vector<std::vector<size_t>>& neighbors
) {
    const size_t dim = box.dim();
    const double rmax2 = rmax * rmax;

    #pragma omp parallel for schedule(dynamic, 64)
    for (long ii = 0; ii < static_cast<long>(n); ++ii) {
        const size_t i = static_cast<size_t>(ii);
        const double* pi = wrapped.data() + i * dim;
        for (size_t j = i + 1; j < n; ++j) {
            if (periodic_distance2(pi, wrapped.data() + j * dim, box) < rmax2) {
                neighbors[i].push_back(j);
            }
        }
    }
}

} // anonymous namespace

PairList find_pairs(const std::vector<double>& wrapped, size_t n, const Box& box, double rmax) {
    const size_t dim = box.dim();
    if (!(rmax > 0.0) || !std::isfinite(rmax)) {
        throw ConfigurationError(fmt::format("rmax must be positive and finite, got {}", rmax));
    }

    // Cells may be wider than rmax; keep their total near max(n, 27)
    const double max_cells = std::max(static_cast<double>(n), 27.0);
    const double axis_cap = std::floor(std::pow(max_cells, 1.0 / dim) + 1e-9);

    std::array<int, 3> ncell = {1, 1, 1};
    bool use_cells = true;
    for (size_t d = 0; d < dim; ++d) {
        ncell[d] = static_cast<int>(std::min(std::floor(box.lengths[d] / rmax), axis_cap));
        if (ncell[d] < 3) use_cells = false;
    }

    std::vector<std::vector<size_t>> neighbors(n);
    if (use_cells) {
        Logger::get().debug("Pair search with {}x{}x{} cell list", ncell[0], ncell[1], ncell[2]);
        neighbors_cell_list(wrapped, n, box, rmax, ncell, neighbors);
    } else {
        Logger::get().debug("Pair search by brute force ({} particles, rmax = {})", n, rmax);
        neighbors_brute_force(wrapped, n, box, rmax, neighbors);
    }

    size_t npairs = 0;
    for (const auto& ngb : neighbors) npairs += ngb.size();

    if (npairs == 0) {
        throw EmptyResultError(fmt::format("Counted 0 pairs within rmax = {}. Try increasing rmax", rmax));
    }

    // First half (i, j) with i < j, second half swapped
    PairList pairs(2 * npairs);
    size_t k = 0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j : neighbors[i]) {
            pairs[k] = Pair{i, j};
            pairs[k + npairs] = Pair{j, i};
            ++k;
        }
    }

    Logger::get().info("Counted {} pairs", npairs);
    return pairs;
}

} // namespace paircorr
