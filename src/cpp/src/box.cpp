#include "paircorr_core.hpp"
#include <algorithm>
#include <functional>
#include <numeric>

namespace paircorr {

double Box::volume() const {
    return std::accumulate(lengths.begin(), lengths.end(), 1.0, std::multiplies<double>());
}

double Box::max_length() const {
    return lengths.empty() ? 0.0 : *std::max_element(lengths.begin(), lengths.end());
}

double Box::min_length() const {
    return lengths.empty() ? 0.0 : *std::min_element(lengths.begin(), lengths.end());
}

void impose_pbc(double* positions, size_t n, const Box& box) {
    const size_t dim = box.dim();

    for (size_t i = 0; i < n; ++i) {
        double* p = positions + i * dim;
        for (size_t d = 0; d < dim; ++d) {
            const double L = box.lengths[d];
            p[d] -= L * std::floor(p[d] / L);
            // Rounding can leave p just outside [0, L)
            if (p[d] < 0.0) p[d] += L;
            if (p[d] >= L) p[d] = 0.0;
        }
    }
}

std::vector<double> wrap_positions(const std::vector<double>& positions, size_t n, const Box& box) {
    std::vector<double> wrapped(positions);
    impose_pbc(wrapped.data(), n, box);
    return wrapped;
}

void closest_image(const double* target, const double* source, const Box& box, double* image) {
    for (size_t d = 0; d < box.dim(); ++d) {
        const double candidates[3] = {
            source[d],
            source[d] - box.lengths[d],
            source[d] + box.lengths[d]
        };

        // First minimum wins on ties
        size_t best = 0;
        for (size_t c = 1; c < 3; ++c) {
            if (std::abs(candidates[c] - target[d]) < std::abs(candidates[best] - target[d])) {
                best = c;
            }
        }
        image[d] = candidates[best];
    }
}

} // namespace paircorr
