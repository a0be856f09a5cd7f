#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"
#include "paircorr_log.hpp"
#include <algorithm>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace paircorr {

namespace {

const Matrix3 identity = {{{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}}};

inline double dot(const double* a, const double* b, size_t n) {
    double sum = 0.0;
    for (size_t k = 0; k < n; ++k) sum += a[k] * b[k];
    return sum;
}

inline void matvec(const Matrix3& R, const double* x, double* out, size_t dim) {
    for (size_t i = 0; i < dim; ++i) {
        out[i] = 0.0;
        for (size_t j = 0; j < dim; ++j) out[i] += R[i][j] * x[j];
    }
}

Matrix3 matmul(const Matrix3& A, const Matrix3& B) {
    Matrix3 C = {};
    for (size_t i = 0; i < 3; ++i)
        for (size_t j = 0; j < 3; ++j)
            for (size_t k = 0; k < 3; ++k)
                C[i][j] += A[i][k] * B[k][j];
    return C;
}

} // anonymous namespace

Matrix3 rotation_matrix(const double* p, size_t dim) {
    if (dim == 2) {
        // Rotation by the signed angle from p to +y
        Matrix3 R = identity;
        R[0][0] = p[1];  R[0][1] = -p[0];
        R[1][0] = p[0];  R[1][1] = p[1];
        return R;
    }

    const double c = std::max(-1.0, std::min(1.0, p[2]));
    const double axis_norm = std::sqrt(p[0] * p[0] + p[1] * p[1]);

    // p parallel to z: the axis p x z vanishes
    if (axis_norm < 1e-12) {
        if (c > 0.0) return identity;
        Matrix3 flip = identity;
        flip[1][1] = -1.0;
        flip[2][2] = -1.0;
        return flip;
    }

    // Rodrigues: R = I + sin(a) K + (1 - cos(a)) K^2 with k = p x z
    const double s = std::sin(std::acos(c));
    const double k[3] = {p[1] / axis_norm, -p[0] / axis_norm, 0.0};
    const Matrix3 K = {{{0.0, -k[2], k[1]},
                        {k[2], 0.0, -k[0]},
                        {-k[1], k[0], 0.0}}};
    const Matrix3 K2 = matmul(K, K);

    Matrix3 R = identity;
    for (size_t i = 0; i < 3; ++i)
        for (size_t j = 0; j < 3; ++j)
            R[i][j] += s * K[i][j] + (1.0 - c) * K2[i][j];
    return R;
}

DisplacementSamples compute_displacements(
    const ParticleSet& particles,
    const std::vector<double>& wrapped,
    const PairList& pairs,
    const Box& box,
    double rmax,
    const BinConfig& bins,
    double z
) {
    const size_t dim = box.dim();
    const size_t n = particles.n;
    const size_t npairs = pairs.size();
    const bool rotate = particles.orientations.has_value();
    const bool weighted = particles.weights.has_value();

    DisplacementSamples samples;
    samples.n_samples = npairs;
    samples.n_coords = bins.n_binned();
    samples.coords.assign(npairs * samples.n_coords, 0.0);
    if (weighted) samples.weights.assign(npairs, 0.0);

    // One frame per particle, built once and shared by all its pairs
    std::vector<Matrix3> frames;
    if (rotate) {
        frames.resize(n);
        const std::vector<double>& orient = *particles.orientations;

        #pragma omp parallel for
        for (long ii = 0; ii < static_cast<long>(n); ++ii) {
            const size_t i = static_cast<size_t>(ii);
            double p[3] = {0.0, 0.0, 0.0};
            const double* raw = orient.data() + i * dim;
            const double norm = std::sqrt(dot(raw, raw, dim));
            for (size_t d = 0; d < dim; ++d) p[d] = raw[d] / norm;
            frames[i] = rotation_matrix(p, dim);
        }
    }

    const int n_coords = samples.n_coords;
    long n_bad_weights = 0;

    #pragma omp parallel for reduction(+:n_bad_weights)
    for (long kk = 0; kk < static_cast<long>(npairs); ++kk) {
        const size_t index = static_cast<size_t>(kk);
        const size_t i = pairs[index][0];
        const size_t j = pairs[index][1];
        const double* r_i = wrapped.data() + i * dim;
        const double* r_j = wrapped.data() + j * dim;

        double r_ij[3] = {0.0, 0.0, 0.0};
        for (size_t d = 0; d < dim; ++d) r_ij[d] = r_j[d] - r_i[d];

        if (std::sqrt(dot(r_ij, r_ij, dim)) >= rmax) {
            double image[3];
            closest_image(r_i, r_j, box, image);
            for (size_t d = 0; d < dim; ++d) r_ij[d] = image[d] - r_i[d];
        }

        if (rotate) {
            double rotated[3] = {0.0, 0.0, 0.0};
            matvec(frames[i], r_ij, rotated, dim);
            std::copy(rotated, rotated + 3, r_ij);
        }

        if (weighted) {
            const size_t k = particles.weight_dim;
            const double* w_i = particles.weights->data() + i * k;
            const double* w_j = particles.weights->data() + j * k;
            const double w = std::pow(dot(w_i, w_j, k), z);
            if (!std::isfinite(w)) ++n_bad_weights;
            samples.weights[index] = w;
        }

        double* out = samples.coords.data() + index * n_coords;
        const double norm = std::sqrt(dot(r_ij, r_ij, dim));
        int c = 0;
        if (bins.r.binned()) {
            out[c++] = norm;
        }
        if (bins.phi.binned()) {
            out[c++] = std::atan2(r_ij[1], r_ij[0]);
        }
        if (bins.theta.binned()) {
            // Coincident particles have no direction; put them at the pole
            out[c++] = norm > 0.0 ? std::acos(std::max(-1.0, std::min(1.0, r_ij[2] / norm))) : 0.0;
        }
    }

    if (n_bad_weights > 0) {
        throw ConfigurationError(fmt::format(
            "(w_i . w_j)^z is not finite for {} pairs with z = {}; "
            "non-integer z requires non-negative dot products and negative z requires non-zero ones",
            n_bad_weights, z));
    }

    return samples;
}

} // namespace paircorr
