#include <gtest/gtest.h>
#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"
#include <numeric>

using namespace paircorr;

namespace {

double total(const std::vector<double>& v) {
    return std::accumulate(v.begin(), v.end(), 0.0);
}

} // anonymous namespace

TEST(VolumeTest, RadialShellsSumToBall3D) {
    BinConfig bins;
    bins.r = BinSpec{0.0, 2.0, 40};
    bins.phi = BinSpec{-M_PI, M_PI, 1};
    bins.theta = BinSpec{0.0, M_PI, 1};

    std::vector<double> vol = compute_bin_volumes(bins, 3);
    ASSERT_EQ(vol.size(), 40u);
    EXPECT_NEAR(total(vol), 4.0 / 3.0 * M_PI * 8.0, 1e-10);
}

TEST(VolumeTest, RadialShellsSumToDisk2D) {
    BinConfig bins;
    bins.r = BinSpec{0.0, 3.0, 25};
    bins.phi = BinSpec{-M_PI, M_PI, 1};
    bins.theta = BinSpec{0.0, M_PI, 1};

    std::vector<double> vol = compute_bin_volumes(bins, 2);
    EXPECT_NEAR(total(vol), M_PI * 9.0, 1e-10);
}

TEST(VolumeTest, ShellIsExactNotMidpoint) {
    BinConfig bins;
    bins.r = BinSpec{1.0, 3.0, 2};
    bins.phi = BinSpec{-M_PI, M_PI, 1};
    bins.theta = BinSpec{0.0, M_PI, 1};

    std::vector<double> vol = compute_bin_volumes(bins, 3);
    // (2^3 - 1^3) / 3 * 2 pi * 2
    EXPECT_NEAR(vol[0], 7.0 / 3.0 * 4.0 * M_PI, 1e-12);
    EXPECT_NEAR(vol[1], 19.0 / 3.0 * 4.0 * M_PI, 1e-12);
}

TEST(VolumeTest, AngularCellsPartitionTheBall) {
    BinConfig bins;
    bins.r = BinSpec{0.5, 2.0, 6};
    bins.phi = BinSpec{-M_PI, M_PI, 8};
    bins.theta = BinSpec{0.0, M_PI, 5};

    std::vector<double> vol = compute_bin_volumes(bins, 3);
    ASSERT_EQ(vol.size(), 6u * 8u * 5u);
    EXPECT_NEAR(total(vol), 4.0 / 3.0 * M_PI * (8.0 - 0.125), 1e-10);
    for (double v : vol) EXPECT_GT(v, 0.0);
}

TEST(VolumeTest, PolarFactorIsSolidAngle) {
    BinConfig bins;
    bins.r = BinSpec{0.0, 1.0, 1};
    bins.phi = BinSpec{-M_PI, M_PI, 1};
    bins.theta = BinSpec{0.0, M_PI, 2};

    std::vector<double> vol = compute_bin_volumes(bins, 3);
    ASSERT_EQ(vol.size(), 2u);
    // Each hemisphere: (1/3) * 2 pi * 1
    EXPECT_NEAR(vol[0], 2.0 * M_PI / 3.0, 1e-12);
    EXPECT_NEAR(vol[1], 2.0 * M_PI / 3.0, 1e-12);
}

TEST(VolumeTest, PolarAxisIgnoredIn2D) {
    BinConfig bins;
    bins.r = BinSpec{0.0, 1.0, 2};
    bins.phi = BinSpec{-M_PI, M_PI, 4};
    bins.theta = BinSpec{0.0, M_PI, 1};

    std::vector<double> vol = compute_bin_volumes(bins, 2);
    ASSERT_EQ(vol.size(), 8u);
    EXPECT_NEAR(vol[0], 0.125 * M_PI / 2.0, 1e-12);
    EXPECT_NEAR(total(vol), M_PI, 1e-12);
}

TEST(VolumeTest, InvalidDimension) {
    BinConfig bins;
    bins.r = BinSpec{0.0, 1.0, 2};
    EXPECT_THROW(compute_bin_volumes(bins, 4), InvalidDimensionError);
}
