#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"
#include "paircorr_log.hpp"
#include <algorithm>
#include <chrono>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace paircorr {

namespace {

/**
 * Bin of x on sorted edges, left-inclusive and right-exclusive except
 * for the last bin, which also takes the final edge. -1 when outside.
 */
inline long find_bin(const std::vector<double>& edges, double x) {
    const size_t nbins = edges.size() - 1;
    if (!(x >= edges.front()) || x > edges.back()) return -1;
    if (x == edges.back()) return static_cast<long>(nbins) - 1;
    return static_cast<long>(std::upper_bound(edges.begin(), edges.end(), x) - edges.begin()) - 1;
}

struct BinnedAxes {
    std::vector<std::vector<double>> edges;
    std::vector<size_t> shape;
    std::vector<size_t> strides;
    size_t total = 1;

    explicit BinnedAxes(const BinConfig& bins) {
        for (const BinSpec* spec : {&bins.r, &bins.phi, &bins.theta}) {
            if (!spec->binned()) continue;
            edges.push_back(spec->edges());
            shape.push_back(static_cast<size_t>(spec->count));
        }
        strides.assign(shape.size(), 1);
        for (size_t a = shape.size(); a-- > 0;) {
            strides[a] = total;
            total *= shape[a];
        }
    }

    // Flat cell index of one sample, -1 if any coordinate falls outside
    long locate(const double* coords) const {
        size_t flat = 0;
        for (size_t a = 0; a < edges.size(); ++a) {
            const long b = find_bin(edges[a], coords[a]);
            if (b < 0) return -1;
            flat += static_cast<size_t>(b) * strides[a];
        }
        return static_cast<long>(flat);
    }
};

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // anonymous namespace

DistributionGrid bin_distribution(
    const DisplacementSamples& samples,
    const BinConfig& bins,
    size_t n,
    const Box& box
) {
    const BinnedAxes axes(bins);
    if (static_cast<size_t>(samples.n_coords) != axes.shape.size()) {
        throw ConfigurationError(fmt::format(
            "Samples carry {} coordinates but {} axes are binned", samples.n_coords, axes.shape.size()));
    }

    const size_t n_cells = axes.total;
    const size_t n_coords = axes.shape.size();
    const size_t n_samples = samples.n_samples;
    const bool weighted = samples.weighted();

    DistributionGrid grid;
    grid.shape = axes.shape;
    grid.counts.assign(n_cells, 0.0);
    grid.n_samples = n_samples;

#ifdef USE_OPENMP
    // Per-thread histograms merged once at the end
    #pragma omp parallel
    {
        std::vector<double> local_counts(n_cells, 0.0);

        #pragma omp for schedule(static)
        for (long s = 0; s < static_cast<long>(n_samples); ++s) {
            const long cell = axes.locate(samples.coords.data() + s * n_coords);
            if (cell < 0) continue;
            local_counts[cell] += weighted ? samples.weights[s] : 1.0;
        }

        #pragma omp critical
        {
            for (size_t c = 0; c < n_cells; ++c) {
                grid.counts[c] += local_counts[c];
            }
        }
    }
#else
    for (size_t s = 0; s < n_samples; ++s) {
        const long cell = axes.locate(samples.coords.data() + s * n_coords);
        if (cell < 0) continue;
        grid.counts[cell] += weighted ? samples.weights[s] : 1.0;
    }
#endif

    // g = count / (N * rho * volume)
    const std::vector<double> vol = compute_bin_volumes(bins, box.dim());
    const double N = static_cast<double>(n);
    const double density = N / box.volume();

    grid.values.resize(n_cells);
    for (size_t c = 0; c < n_cells; ++c) {
        grid.values[c] = grid.counts[c] / (N * vol[c] * density);
    }

    grid.r = bins.r.left_edges();
    grid.phi = bins.phi.left_edges();
    if (box.dim() == 3) {
        grid.theta = bins.theta.left_edges();
    }

    return grid;
}

DistributionGrid compute_correlation(
    const ParticleSet& particles,
    const Box& box,
    const CorrelationOptions& options
) {
    validate_inputs(particles, box);
    const BinConfig bins = resolve_bins(options, box);
    const double rmax = bins.r.max;

    Logger& log = Logger::get();
    auto t0 = std::chrono::steady_clock::now();

    const std::vector<double> wrapped = wrap_positions(particles.positions, particles.n, box);
    const PairList pairs = find_pairs(wrapped, particles.n, box, rmax);
    log.debug("Pair search: {:.3f} ms", elapsed_ms(t0));

    auto t1 = std::chrono::steady_clock::now();
    const DisplacementSamples samples =
        compute_displacements(particles, wrapped, pairs, box, rmax, bins, options.z);
    log.debug("Displacement calculation: {:.3f} ms", elapsed_ms(t1));

    auto t2 = std::chrono::steady_clock::now();
    DistributionGrid grid = bin_distribution(samples, bins, particles.n, box);
    log.debug("Binning: {:.3f} ms", elapsed_ms(t2));

    return grid;
}

} // namespace paircorr
