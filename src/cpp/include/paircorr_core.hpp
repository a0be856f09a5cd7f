#pragma once

#include <vector>
#include <array>
#include <optional>
#include <cstddef>
#include <cmath>

namespace paircorr {

/**
 * Axis-aligned periodic box. One positive side length per dimension.
 */
struct Box {
    std::vector<double> lengths;

    size_t dim() const { return lengths.size(); }
    double volume() const;
    double max_length() const;
    double min_length() const;
};

/**
 * A static particle configuration.
 *
 * All arrays are flat and row-major. positions and orientations hold
 * n * dim values; weights hold n * weight_dim values. Absent optional
 * data is std::nullopt, never an empty array.
 */
struct ParticleSet {
    size_t n = 0;
    size_t dim = 0;
    std::vector<double> positions;
    std::optional<std::vector<double>> orientations;
    std::optional<std::vector<double>> weights;
    size_t weight_dim = 0;

    const double* position(size_t i) const { return positions.data() + i * dim; }
};

/**
 * Binning of one coordinate axis.
 * count <= 1 means the axis is not binned (one implicit bin over [min, max]).
 */
struct BinSpec {
    double min = 0.0;
    double max = 0.0;
    int count = 1;

    bool binned() const { return count > 1; }
    int bins() const { return count > 1 ? count : 1; }

    /** count + 1 evenly spaced edges from min to max. */
    std::vector<double> edges() const;
    /** The count left edges. */
    std::vector<double> left_edges() const;
};

/** Binning of the (r, phi, theta) axes. */
struct BinConfig {
    BinSpec r;
    BinSpec phi;
    BinSpec theta;

    int n_binned() const { return int(r.binned()) + int(phi.binned()) + int(theta.binned()); }
};

/**
 * Per-call configuration. Unset values take the defaults:
 * rmin = 0, rmax = max(box)/2, nphi and ntheta unbinned, z = 1.
 */
struct CorrelationOptions {
    std::optional<double> rmin;
    std::optional<double> rmax;
    int nr = 100;
    std::optional<int> nphi;
    std::optional<int> ntheta;
    double z = 1.0;
};

/** Ordered (i, j) index pair. */
using Pair = std::array<size_t, 2>;
using PairList = std::vector<Pair>;

using Matrix3 = std::array<std::array<double, 3>, 3>;

/**
 * Coordinates of every ordered pair, one row of n_coords values per
 * sample in (r, phi, theta) order restricted to binned axes.
 * weights is empty when the particles carry no weight vectors.
 */
struct DisplacementSamples {
    size_t n_samples = 0;
    int n_coords = 0;
    std::vector<double> coords;
    std::vector<double> weights;

    bool weighted() const { return !weights.empty(); }
};

/**
 * Normalized distribution g over the binned axes only.
 *
 * values and counts are row-major with the given shape. r, phi and
 * theta are left bin edges; theta is empty for 2D boxes.
 */
struct DistributionGrid {
    std::vector<size_t> shape;
    std::vector<double> values;
    std::vector<double> counts;
    std::vector<double> r;
    std::vector<double> phi;
    std::vector<double> theta;
    size_t n_samples = 0;

    size_t size() const { return values.size(); }
};

struct StructureFactorResult {
    std::vector<double> s;
    std::vector<double> q;
};

/**
 * Check that the box and particle arrays are consistent.
 * Throws InvalidDimensionError, ShapeMismatchError or ConfigurationError.
 */
void validate_inputs(const ParticleSet& particles, const Box& box);

/**
 * Resolve binning options against a box.
 *
 * @param options  Caller options (unset values take defaults)
 * @param box      Periodic box, 2D or 3D
 * @return         Bin specifications for r, phi and theta
 */
BinConfig resolve_bins(const CorrelationOptions& options, const Box& box);

/**
 * Wrap every coordinate into [0, L) in place.
 *
 * @param positions Flat array of n * box.dim() coordinates
 * @param n         Number of particles
 * @param box       Periodic box
 */
void impose_pbc(double* positions, size_t n, const Box& box);

/** Wrapped copy of a flat position array. */
std::vector<double> wrap_positions(const std::vector<double>& positions, size_t n, const Box& box);

/**
 * Find every pair closer than rmax under periodic boundaries.
 *
 * @param wrapped  Flat positions already inside [0, L)
 * @param n        Number of particles
 * @param box      Periodic box
 * @param rmax     Cutoff radius
 * @return         2P ordered pairs: (i, j) with i < j, then (j, i)
 * @throws EmptyResultError if no pair lies within rmax
 */
PairList find_pairs(const std::vector<double>& wrapped, size_t n, const Box& box, double rmax);

/**
 * Per-axis closest periodic image of source relative to target.
 *
 * @param target Target position (dim values)
 * @param source Source position (dim values)
 * @param box    Periodic box
 * @param image  Output, dim values
 */
void closest_image(const double* target, const double* source, const Box& box, double* image);

/**
 * Rotation taking the unit vector p onto the reference axis
 * (+y in 2D, +z in 3D). In 2D only the upper-left 2x2 block is used.
 */
Matrix3 rotation_matrix(const double* p, size_t dim);

/**
 * Compute displacement coordinates and pair weights for each ordered pair.
 *
 * @param particles  Particle set (orientations normalized on use)
 * @param wrapped    Wrapped positions
 * @param pairs      Ordered pair list
 * @param box        Periodic box
 * @param rmax       Cutoff used to decide when to search periodic images
 * @param bins       Which axes are binned
 * @param z          Exponent applied to w_i . w_j
 */
DisplacementSamples compute_displacements(
    const ParticleSet& particles,
    const std::vector<double>& wrapped,
    const PairList& pairs,
    const Box& box,
    double rmax,
    const BinConfig& bins,
    double z
);

/**
 * Exact volume of every (r, phi, theta) cell, row-major over
 * (r.bins(), phi.bins(), theta.bins()).
 *
 * @param bins Bin configuration
 * @param dim  Space dimension (2 or 3)
 */
std::vector<double> compute_bin_volumes(const BinConfig& bins, size_t dim);

/**
 * Histogram samples over the binned axes and normalize by N * rho * volume.
 *
 * @param samples  Displacement samples
 * @param bins     Bin configuration
 * @param n        Number of particles
 * @param box      Periodic box
 */
DistributionGrid bin_distribution(
    const DisplacementSamples& samples,
    const BinConfig& bins,
    size_t n,
    const Box& box
);

/**
 * Full pipeline: wrap, find pairs, displacements, histogram.
 *
 * Computes G(r, phi, theta) = <(w_i . w_j)^z> when weights are present
 * and g(r, phi, theta) otherwise.
 */
DistributionGrid compute_correlation(
    const ParticleSet& particles,
    const Box& box,
    const CorrelationOptions& options
);

/** Composite Simpson integral of y over the sample points x. */
double simpson(const std::vector<double>& y, const std::vector<double>& x);

/** q_k = k * dq for k = 1..199 with dq = 2 pi / max(L). */
std::vector<double> default_wavenumbers(const Box& box);

/**
 * Isotropic Fourier transform of a radial correlation function.
 *
 * @param g                  Correlation values on r
 * @param r                  Radial sample points
 * @param n                  Number of particles
 * @param box                Periodic box, 2D or 3D
 * @param q                  Wavenumbers, default_wavenumbers() when unset
 * @param subtract_baseline  Integrate g - 1 instead of g
 */
StructureFactorResult compute_structure_factor(
    const std::vector<double>& g,
    const std::vector<double>& r,
    size_t n,
    const Box& box,
    const std::optional<std::vector<double>>& q,
    bool subtract_baseline
);

} // namespace paircorr
