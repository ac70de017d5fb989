#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "kconv_errors.hpp"
#include "spectrum/binning.hpp"

namespace {

Spectrum make_checkerboard(size_t n_energy, size_t n_theta) {
    std::vector<double> energy, theta, data;
    for (size_t i = 0; i < n_energy; ++i) energy.push_back(16.0 + 0.01 * i);
    for (size_t j = 0; j < n_theta; ++j) theta.push_back(-5.0 + 0.5 * j);
    for (size_t i = 0; i < n_energy; ++i) {
        for (size_t j = 0; j < n_theta; ++j) {
            data.push_back((i + j) % 2);
        }
    }
    return Spectrum({{"eV", energy}, {"theta_par", theta}}, data);
}

}  // namespace

TEST(Binning, CheckerboardAveragesExactly) {
    auto spectrum = make_checkerboard(6, 4);
    auto binned = bin(spectrum, BinningSpec{{{"eV", 2}, {"theta_par", 2}}});
    EXPECT_EQ(binned.shape(), (std::vector<size_t>{3, 2}));
    for (double v : binned.data()) {
        EXPECT_DOUBLE_EQ(v, 0.5);
    }
    EXPECT_NEAR(binned.axis("eV").values[0], 16.005, 1e-12);
    EXPECT_DOUBLE_EQ(binned.axis("theta_par").values[1], -3.75);
}

TEST(Binning, TrailingBlockIsPadded) {
    auto spectrum = make_checkerboard(5, 7);
    auto binned = bin(spectrum, BinningSpec{{{"eV", 2}, {"theta_par", 2}}});
    // Each axis loses floor(n / 2) samples
    EXPECT_EQ(binned.shape(), (std::vector<size_t>{3, 4}));
    // Last theta block holds the single column j = 6
    EXPECT_DOUBLE_EQ(binned.axis("theta_par").values.back(), -2.0);
    std::vector<size_t> corner{2, 3};
    // Row i = 4, column j = 6
    EXPECT_DOUBLE_EQ(binned.at(corner), 0.0);
}

TEST(Binning, SkipsNaNSamples) {
    auto nan = std::numeric_limits<double>::quiet_NaN();
    Spectrum spectrum({{"eV", {1.0, 2.0, 3.0, 4.0}}}, {nan, 4.0, nan, nan});
    auto binned = bin(spectrum, BinningSpec{{{"eV", 2}}});
    EXPECT_DOUBLE_EQ(binned.data()[0], 4.0);
    EXPECT_TRUE(std::isnan(binned.data()[1]));
}

TEST(Binning, IdentityLeavesSpectrumAlone) {
    auto spectrum = make_checkerboard(4, 4);
    BinningSpec spec{{{"eV", 1}}};
    EXPECT_TRUE(spec.is_identity());
    auto binned = bin(spectrum, spec);
    EXPECT_EQ(binned.shape(), spectrum.shape());
    EXPECT_TRUE(binned.metadata().history.empty());
}

TEST(Binning, RecordsHistory) {
    auto binned = bin(make_checkerboard(4, 4), BinningSpec{{{"theta_par", 2}}});
    ASSERT_EQ(binned.metadata().history.size(), 1);
    EXPECT_EQ(binned.metadata().history[0].rfind("Binned by", 0), 0);
}

TEST(Binning, RejectsBadSpecs) {
    auto spectrum = make_checkerboard(4, 4);
    EXPECT_THROW(bin(spectrum, BinningSpec{{{"hv", 2}}}), ConfigurationError);
    EXPECT_THROW(bin(spectrum, BinningSpec{{{"eV", 0}}}), ConfigurationError);
}
