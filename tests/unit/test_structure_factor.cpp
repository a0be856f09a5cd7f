#include <gtest/gtest.h>
#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"

using namespace paircorr;

namespace {

std::vector<double> grid(double lo, double hi, size_t n) {
    std::vector<double> x(n);
    for (size_t i = 0; i < n; ++i) x[i] = lo + (hi - lo) * i / (n - 1);
    return x;
}

} // anonymous namespace

TEST(SimpsonTest, ExactForCubicOnEvenIntervals) {
    std::vector<double> x = grid(0.0, 2.0, 5);
    std::vector<double> y;
    for (double v : x) y.push_back(v * v * v);
    EXPECT_NEAR(simpson(y, x), 4.0, 1e-12);
}

TEST(SimpsonTest, OddIntervalCountUsesEndCorrection) {
    std::vector<double> x = {0.0, 1.0, 2.0, 3.0};
    std::vector<double> y = {0.0, 1.0, 4.0, 9.0};
    EXPECT_NEAR(simpson(y, x), 9.0, 1e-12);
}

TEST(SimpsonTest, NonUniformGrid) {
    std::vector<double> x = {0.0, 0.5, 2.0};
    std::vector<double> y = {0.0, 0.25, 4.0};
    EXPECT_NEAR(simpson(y, x), 8.0 / 3.0, 1e-12);
}

TEST(SimpsonTest, DegenerateSizes) {
    EXPECT_DOUBLE_EQ(simpson({1.0, 3.0}, {0.0, 2.0}), 4.0);
    EXPECT_DOUBLE_EQ(simpson({5.0}, {1.0}), 0.0);
    EXPECT_DOUBLE_EQ(simpson({}, {}), 0.0);
    EXPECT_THROW(simpson({1.0, 2.0}, {0.0}), ShapeMismatchError);
}

TEST(StructureFactorTest, DefaultWavenumbers) {
    Box box{{10.0, 20.0, 5.0}};
    std::vector<double> q = default_wavenumbers(box);
    const double dq = 2.0 * M_PI / 20.0;
    ASSERT_EQ(q.size(), 199u);
    EXPECT_DOUBLE_EQ(q.front(), dq);
    EXPECT_NEAR(q.back(), 199.0 * dq, 1e-12);
}

TEST(StructureFactorTest, IdealGasIsFlat) {
    Box box{{10.0, 10.0, 10.0}};
    std::vector<double> r = grid(0.0, 5.0, 51);
    std::vector<double> g(r.size(), 1.0);

    StructureFactorResult res = compute_structure_factor(g, r, 500, box, std::nullopt, true);
    ASSERT_EQ(res.s.size(), 199u);
    for (double s : res.s) EXPECT_DOUBLE_EQ(s, 1.0);
}

TEST(StructureFactorTest, GaussianTransform3D) {
    Box box{{10.0, 10.0, 10.0}};
    const double rho = 100.0 / box.volume();
    std::vector<double> r = grid(0.0, 8.0, 801);
    std::vector<double> G;
    for (double v : r) G.push_back(std::exp(-v * v));

    std::vector<double> q = {0.0, 0.5, 1.0, 2.0, 4.0};
    StructureFactorResult res = compute_structure_factor(G, r, 100, box, q, false);
    ASSERT_EQ(res.q, q);
    for (size_t k = 0; k < q.size(); ++k) {
        const double expected = 1.0 + std::pow(M_PI, 1.5) * rho * std::exp(-q[k] * q[k] / 4.0);
        EXPECT_NEAR(res.s[k], expected, 1e-6) << "q = " << q[k];
    }
}

TEST(StructureFactorTest, GaussianTransform2D) {
    Box box{{10.0, 10.0}};
    const double rho = 10.0 / box.volume();
    std::vector<double> r = grid(0.0, 8.0, 801);
    std::vector<double> G;
    for (double v : r) G.push_back(std::exp(-v * v));

    std::vector<double> q = {0.0, 0.5, 1.0, 2.0, 4.0};
    StructureFactorResult res = compute_structure_factor(G, r, 10, box, q, false);
    for (size_t k = 0; k < q.size(); ++k) {
        const double expected = 1.0 + M_PI * rho * std::exp(-q[k] * q[k] / 4.0);
        EXPECT_NEAR(res.s[k], expected, 1e-6) << "q = " << q[k];
    }
}

TEST(StructureFactorTest, BaselineSubtraction) {
    Box box{{10.0, 10.0, 10.0}};
    std::vector<double> r = grid(0.0, 5.0, 101);
    std::vector<double> g, h;
    for (double v : r) {
        g.push_back(1.0 + 0.5 * std::exp(-v) * std::cos(3.0 * v));
        h.push_back(g.back() - 1.0);
    }

    StructureFactorResult a = compute_structure_factor(g, r, 200, box, std::nullopt, true);
    StructureFactorResult b = compute_structure_factor(h, r, 200, box, std::nullopt, false);
    ASSERT_EQ(a.s.size(), b.s.size());
    for (size_t k = 0; k < a.s.size(); ++k) {
        EXPECT_NEAR(a.s[k], b.s[k], 1e-12);
    }
}

TEST(StructureFactorTest, RejectsBadInput) {
    std::vector<double> r = grid(0.0, 1.0, 5);
    std::vector<double> g(5, 1.0);

    EXPECT_THROW(compute_structure_factor(g, r, 10, Box{{10.0}}, std::nullopt, true), InvalidDimensionError);
    EXPECT_THROW(compute_structure_factor(g, grid(0.0, 1.0, 4), 10, Box{{10.0, 10.0}}, std::nullopt, true),
                 ShapeMismatchError);
    EXPECT_THROW(compute_structure_factor(g, r, 10, Box{{10.0, 10.0}}, std::vector<double>{1.0, -0.5}, true),
                 ConfigurationError);
}
