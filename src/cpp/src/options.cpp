#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"
#include "paircorr_log.hpp"
#include <fmt/format.h>

namespace paircorr {

namespace {

bool all_finite(const std::vector<double>& values) {
    for (double v : values) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

void check_dimension(size_t dim) {
    if (dim != 2 && dim != 3) {
        throw InvalidDimensionError(fmt::format("Dimension of space must be 2 or 3, got {}", dim));
    }
}

} // anonymous namespace

std::vector<double> BinSpec::edges() const {
    const int n = bins();
    std::vector<double> e(n + 1);
    const double step = (max - min) / n;
    for (int i = 0; i < n; ++i) {
        e[i] = min + i * step;
    }
    e[n] = max;
    return e;
}

std::vector<double> BinSpec::left_edges() const {
    std::vector<double> e = edges();
    e.pop_back();
    return e;
}

void validate_inputs(const ParticleSet& particles, const Box& box) {
    check_dimension(box.dim());

    for (double L : box.lengths) {
        if (!(L > 0.0) || !std::isfinite(L)) {
            throw ConfigurationError(fmt::format("Box side lengths must be positive, got {}", L));
        }
    }

    const size_t n = particles.n;
    const size_t dim = box.dim();

    if (particles.dim != dim) {
        throw ShapeMismatchError(fmt::format(
            "Positions have dimension {} but the box has dimension {}", particles.dim, dim));
    }
    if (particles.positions.size() != n * dim) {
        throw ShapeMismatchError(fmt::format(
            "Shape of positions must be ({}, {})", n, dim));
    }
    if (!all_finite(particles.positions)) {
        throw ConfigurationError("Positions must be finite");
    }

    if (particles.orientations) {
        if (particles.orientations->size() != n * dim) {
            throw ShapeMismatchError(fmt::format(
                "Shape of orientations must match positions array ({}, {})", n, dim));
        }
        for (size_t i = 0; i < n; ++i) {
            const double* p = particles.orientations->data() + i * dim;
            double norm2 = 0.0;
            for (size_t d = 0; d < dim; ++d) norm2 += p[d] * p[d];
            if (!(norm2 > 0.0) || !std::isfinite(norm2)) {
                throw ConfigurationError(fmt::format("Orientation of particle {} has zero or non-finite length", i));
            }
        }
    }

    if (particles.weights) {
        if (particles.weight_dim == 0 || particles.weights->size() != n * particles.weight_dim) {
            throw ShapeMismatchError(fmt::format(
                "Shape of weights must be ({}, k) with k >= 1", n));
        }
        if (!all_finite(*particles.weights)) {
            throw ConfigurationError("Weights must be finite");
        }
    }
}

BinConfig resolve_bins(const CorrelationOptions& options, const Box& box) {
    check_dimension(box.dim());

    const double rmin = options.rmin.value_or(0.0);
    const double rmax = options.rmax.value_or(box.max_length() / 2.0);

    if (!(rmin >= 0.0)) {
        throw ConfigurationError(fmt::format("rmin must be non-negative, got {}", rmin));
    }
    if (!(rmax > rmin) || !std::isfinite(rmax)) {
        throw ConfigurationError(fmt::format("rmax must be finite and greater than rmin ({}), got {}", rmin, rmax));
    }

    BinConfig bins;
    bins.r = BinSpec{rmin, rmax, options.nr < 1 ? 1 : options.nr};
    bins.phi = BinSpec{-M_PI, M_PI, options.nphi.value_or(1) < 1 ? 1 : options.nphi.value_or(1)};

    int ntheta = options.ntheta.value_or(1);
    if (ntheta < 1 || box.dim() == 2) ntheta = 1;
    bins.theta = BinSpec{0.0, M_PI, ntheta};

    if (bins.n_binned() == 0) {
        throw ConfigurationError("At least one of nr, nphi, ntheta must be greater than 1");
    }

    if (rmax > box.min_length() / 2.0) {
        Logger::get().warn("rmax = {} exceeds half the smallest box side ({}); "
                           "displacements use per-axis closest images", rmax, box.min_length() / 2.0);
    }

    return bins;
}

} // namespace paircorr
