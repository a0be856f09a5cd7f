#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace paircorr {

std::vector<double> compute_bin_volumes(const BinConfig& bins, size_t dim) {
    if (dim != 2 && dim != 3) {
        throw InvalidDimensionError("Dimension of space must be 2 or 3");
    }

    const std::vector<double> r = bins.r.edges();
    const std::vector<double> phi = bins.phi.edges();
    const std::vector<double> theta = bins.theta.edges();
    const int nr = bins.r.bins();
    const int nphi = bins.phi.bins();
    const int ntheta = bins.theta.bins();
    const double d = static_cast<double>(dim);

    std::vector<double> vol(static_cast<size_t>(nr) * nphi * ntheta);

    #pragma omp parallel for
    for (int n = 0; n < nr; ++n) {
        // Exact shell measure (r_hi^d - r_lo^d) / d
        const double dr = (std::pow(r[n + 1], d) - std::pow(r[n], d)) / d;
        for (int m = 0; m < nphi; ++m) {
            const double dphi = phi[m + 1] - phi[m];
            for (int l = 0; l < ntheta; ++l) {
                double v = dphi * dr;
                if (dim == 3) {
                    v *= std::cos(theta[l]) - std::cos(theta[l + 1]);
                }
                vol[(static_cast<size_t>(n) * nphi + m) * ntheta + l] = v;
            }
        }
    }

    return vol;
}

} // namespace paircorr
