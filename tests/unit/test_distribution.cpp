#include <gtest/gtest.h>
#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"
#include <numeric>

using namespace paircorr;

namespace {

BinConfig radial_only(double rmin, double rmax, int nr) {
    BinConfig bins;
    bins.r = BinSpec{rmin, rmax, nr};
    bins.phi = BinSpec{-M_PI, M_PI, 1};
    bins.theta = BinSpec{0.0, M_PI, 1};
    return bins;
}

DisplacementSamples one_coord(const std::vector<double>& values) {
    DisplacementSamples s;
    s.n_samples = values.size();
    s.n_coords = 1;
    s.coords = values;
    return s;
}

} // anonymous namespace

TEST(BinSpecTest, EdgesAndLeftEdges) {
    BinSpec spec{0.0, 2.0, 4};
    std::vector<double> e = spec.edges();
    ASSERT_EQ(e.size(), 5u);
    EXPECT_DOUBLE_EQ(e[0], 0.0);
    EXPECT_DOUBLE_EQ(e[2], 1.0);
    EXPECT_DOUBLE_EQ(e[4], 2.0);
    EXPECT_EQ(spec.left_edges().size(), 4u);

    BinSpec unbinned{-M_PI, M_PI, 1};
    EXPECT_FALSE(unbinned.binned());
    EXPECT_EQ(unbinned.edges().size(), 2u);
    EXPECT_EQ(unbinned.left_edges().size(), 1u);
}

TEST(DistributionTest, LastBinIncludesRightEdge) {
    Box box{{10.0, 10.0, 10.0}};
    BinConfig bins = radial_only(0.0, 2.0, 2);
    DisplacementSamples s = one_coord({0.0, 0.5, 1.0, 1.5, 2.0, 2.5, -0.1});

    DistributionGrid grid = bin_distribution(s, bins, 10, box);

    ASSERT_EQ(grid.shape, (std::vector<size_t>{2}));
    EXPECT_DOUBLE_EQ(grid.counts[0], 2.0);
    EXPECT_DOUBLE_EQ(grid.counts[1], 3.0);
}

TEST(DistributionTest, NormalizesByDensityAndVolume) {
    Box box{{10.0, 10.0, 10.0}};
    BinConfig bins = radial_only(0.0, 1.0, 1);
    bins.theta = BinSpec{0.0, M_PI, 2};
    DisplacementSamples s = one_coord({0.1, 0.2, 3.5});

    DistributionGrid grid = bin_distribution(s, bins, 100, box);

    // Two samples in the upper hemisphere of volume 2 pi / 3, one past pi; rho = 0.1
    const double expected = 2.0 / (100.0 * 0.1 * 2.0 * M_PI / 3.0);
    EXPECT_NEAR(grid.values[0], expected, 1e-12);
    EXPECT_DOUBLE_EQ(grid.values[1], 0.0);
}

TEST(DistributionTest, BinningConservesSampleCount) {
    Box box{{8.0, 8.0, 8.0}};
    BinConfig bins;
    bins.r = BinSpec{0.0, 3.0, 7};
    bins.phi = BinSpec{-M_PI, M_PI, 5};
    bins.theta = BinSpec{0.0, M_PI, 3};

    DisplacementSamples s;
    s.n_coords = 3;
    for (int k = 0; k < 300; ++k) {
        s.coords.push_back(0.01 * k);
        s.coords.push_back(-M_PI + 2.0 * M_PI * (((k * 37) % 300) / 300.0));
        s.coords.push_back(M_PI * (((k * 11) % 300) / 300.0));
    }
    s.n_samples = 300;

    const size_t n = 50;
    DistributionGrid grid = bin_distribution(s, bins, n, box);
    std::vector<double> vol = compute_bin_volumes(bins, 3);
    const double rho = n / box.volume();

    double recovered = 0.0;
    for (size_t c = 0; c < grid.size(); ++c) {
        recovered += grid.values[c] * n * rho * vol[c];
    }
    // r = 0.01 k lies in [0, 3] for k <= 300
    EXPECT_NEAR(recovered, 300.0, 1e-9);
    EXPECT_DOUBLE_EQ(std::accumulate(grid.counts.begin(), grid.counts.end(), 0.0), 300.0);
}

TEST(DistributionTest, UnbinnedAxesAreSqueezed) {
    Box box{{10.0, 10.0, 10.0}};
    BinConfig bins;
    bins.r = BinSpec{0.0, 2.0, 1};
    bins.phi = BinSpec{-M_PI, M_PI, 6};
    bins.theta = BinSpec{0.0, M_PI, 1};

    DistributionGrid grid = bin_distribution(one_coord({0.0, 1.0}), bins, 2, box);
    EXPECT_EQ(grid.shape, (std::vector<size_t>{6}));
    EXPECT_EQ(grid.r.size(), 1u);
    EXPECT_EQ(grid.phi.size(), 6u);
    EXPECT_EQ(grid.theta.size(), 1u);
}

TEST(DistributionTest, ThetaEdgesOmittedIn2D) {
    Box box{{10.0, 10.0}};
    BinConfig bins = radial_only(0.0, 2.0, 4);
    DistributionGrid grid = bin_distribution(one_coord({0.5}), bins, 2, box);
    EXPECT_TRUE(grid.theta.empty());
    EXPECT_EQ(grid.r.size(), 4u);
}

TEST(DistributionTest, WeightsReplaceCounts) {
    Box box{{10.0, 10.0}};
    BinConfig bins = radial_only(0.0, 2.0, 2);
    DisplacementSamples s = one_coord({0.5, 0.7, 1.5});
    s.weights = {0.25, 0.5, -2.0};

    DistributionGrid grid = bin_distribution(s, bins, 4, box);
    EXPECT_DOUBLE_EQ(grid.counts[0], 0.75);
    EXPECT_DOUBLE_EQ(grid.counts[1], -2.0);
}

TEST(DistributionTest, CoordinateCountMustMatchBinnedAxes) {
    Box box{{10.0, 10.0, 10.0}};
    BinConfig bins = radial_only(0.0, 2.0, 2);
    bins.phi = BinSpec{-M_PI, M_PI, 3};
    EXPECT_THROW(bin_distribution(one_coord({0.5}), bins, 2, box), ConfigurationError);
}
