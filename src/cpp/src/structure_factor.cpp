#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"
#include "paircorr_log.hpp"
#include <boost/math/special_functions/bessel.hpp>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace paircorr {

double simpson(const std::vector<double>& y, const std::vector<double>& x) {
    if (y.size() != x.size()) {
        throw ShapeMismatchError(fmt::format(
            "simpson: {} values but {} sample points", y.size(), x.size()));
    }

    const size_t n = x.size();
    if (n < 2) return 0.0;
    if (n == 2) return 0.5 * (x[1] - x[0]) * (y[0] + y[1]);

    // Composite 1/3 rule on pairs of (possibly unequal) intervals
    const size_t last = (n % 2 == 1) ? n - 1 : n - 2;
    double result = 0.0;
    for (size_t i = 0; i + 2 <= last; i += 2) {
        const double h0 = x[i + 1] - x[i];
        const double h1 = x[i + 2] - x[i + 1];
        const double hsum = h0 + h1;
        const double hprod = h0 * h1;
        const double ratio = h0 / h1;
        result += hsum / 6.0 * (y[i] * (2.0 - 1.0 / ratio)
                                + y[i + 1] * hsum * hsum / hprod
                                + y[i + 2] * (2.0 - ratio));
    }

    // Odd number of intervals: three-point correction for the last one
    if (n % 2 == 0) {
        const double h0 = x[n - 2] - x[n - 3];
        const double h1 = x[n - 1] - x[n - 2];
        const double alpha = (2.0 * h1 * h1 + 3.0 * h0 * h1) / (6.0 * (h0 + h1));
        const double beta = (h1 * h1 + 3.0 * h0 * h1) / (6.0 * h0);
        const double eta = h1 * h1 * h1 / (6.0 * h0 * (h0 + h1));
        result += alpha * y[n - 1] + beta * y[n - 2] - eta * y[n - 3];
    }

    return result;
}

std::vector<double> default_wavenumbers(const Box& box) {
    const double dq = 2.0 * M_PI / box.max_length();
    std::vector<double> q(199);
    for (size_t k = 0; k < q.size(); ++k) {
        q[k] = (k + 1) * dq;
    }
    return q;
}

StructureFactorResult compute_structure_factor(
    const std::vector<double>& g,
    const std::vector<double>& r,
    size_t n,
    const Box& box,
    const std::optional<std::vector<double>>& q,
    bool subtract_baseline
) {
    const size_t ndim = box.dim();
    if (ndim != 2 && ndim != 3) {
        throw InvalidDimensionError("Dimension of space must be 2 or 3");
    }
    if (g.size() != r.size()) {
        throw ShapeMismatchError(fmt::format(
            "g has {} values but r has {}", g.size(), r.size()));
    }

    StructureFactorResult result;
    result.q = q ? *q : default_wavenumbers(box);
    result.s.resize(result.q.size());
    for (double qk : result.q) {
        if (!(qk >= 0.0) || !std::isfinite(qk)) {
            throw ConfigurationError(fmt::format("Wavenumbers must be finite and non-negative, got {}", qk));
        }
    }

    const double rho = static_cast<double>(n) / box.volume();
    const size_t nr = r.size();

    std::vector<double> G(g);
    if (subtract_baseline) {
        for (double& v : G) v -= 1.0;
    }

    #pragma omp parallel for schedule(dynamic)
    for (long kk = 0; kk < static_cast<long>(result.q.size()); ++kk) {
        const double qk = result.q[kk];
        std::vector<double> f(nr);

        if (ndim == 3) {
            if (qk == 0.0) {
                // sin(qr)/q -> r
                for (size_t i = 0; i < nr; ++i) f[i] = r[i] * r[i] * G[i];
                result.s[kk] = 1.0 + 4.0 * M_PI * rho * simpson(f, r);
            } else {
                for (size_t i = 0; i < nr; ++i) f[i] = std::sin(qk * r[i]) * r[i] * G[i];
                result.s[kk] = 1.0 + 4.0 * M_PI * rho * simpson(f, r) / qk;
            }
        } else {
            for (size_t i = 0; i < nr; ++i) {
                f[i] = boost::math::cyl_bessel_j(0, qk * r[i]) * r[i] * G[i];
            }
            result.s[kk] = 1.0 + 2.0 * M_PI * rho * simpson(f, r);
        }
    }

    Logger::get().debug("Structure factor evaluated at {} wavenumbers", result.q.size());
    return result;
}

} // namespace paircorr
