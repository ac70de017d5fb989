#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <vector>

#include "energy/fermi_estimate.hpp"
#include "spectrum/sample_data.hpp"

namespace {

/// Fermi-Dirac edge on a constant background
std::vector<double> fermi_edc(const std::vector<double> &energy, double EF, double width) {
    std::vector<double> intensity;
    for (double E : energy) {
        intensity.push_back(1.0 / (std::exp((E - EF) / width) + 1.0) + 0.1);
    }
    return intensity;
}

}  // namespace

TEST(FermiEstimate, FindsSharpEdge) {
    auto energy = linspace(16.0, 17.0, 201);
    auto intensity = fermi_edc(energy, 16.8, 0.01);
    auto EF = estimate_fermi_level(energy, intensity);
    ASSERT_TRUE(EF.has_value());
    EXPECT_NEAR(*EF, 16.8, 0.006);
}

TEST(FermiEstimate, RoundsToMillielectronvolt) {
    auto energy = linspace(5.0, 7.0, 301);
    auto EF = estimate_fermi_level(energy, fermi_edc(energy, 6.3, 0.02));
    ASSERT_TRUE(EF.has_value());
    EXPECT_DOUBLE_EQ(*EF, std::round(*EF * 1000.0) / 1000.0);
    EXPECT_NEAR(*EF, 6.3, 0.01);
}

TEST(FermiEstimate, TreatsNaNAsZero) {
    auto energy = linspace(16.0, 17.0, 201);
    auto intensity = fermi_edc(energy, 16.5, 0.01);
    intensity.front() = std::nan("");
    auto EF = estimate_fermi_level(energy, intensity);
    ASSERT_TRUE(EF.has_value());
    EXPECT_NEAR(*EF, 16.5, 0.006);
}

TEST(FermiEstimate, SampleDispersionEdge) {
    auto spectrum = make_sample_dispersion();
    auto &eV = spectrum.axis("eV").values;
    size_t n_theta = spectrum.axis("theta_par").size();
    std::vector<double> edc(eV.size(), 0.0);
    auto view = spectrum.view<2>({"eV", "theta_par"});
    for (size_t i = 0; i < eV.size(); ++i) {
        for (size_t j = 0; j < n_theta; ++j) {
            edc[i] += view.data_handle()[i * view.stride(0) + j * view.stride(1)];
        }
    }
    auto EF = estimate_fermi_level(eV, edc);
    ASSERT_TRUE(EF.has_value());
    EXPECT_NEAR(*EF, 16.8, 0.03);
}

TEST(FermiEstimate, TooFewSamples) {
    std::vector<double> energy{1.0, 2.0, 3.0};
    std::vector<double> intensity{1.0, 1.0, 0.0};
    EXPECT_FALSE(estimate_fermi_level(energy, intensity).has_value());
    std::vector<double> short_intensity{1.0};
    EXPECT_THROW(estimate_fermi_level(energy, short_intensity), std::invalid_argument);
}

TEST(FermiEstimate, PhotonEnergyHeuristic) {
    EXPECT_DOUBLE_EQ(estimate_photon_energy(16.8), 21.2182);
    EXPECT_DOUBLE_EQ(estimate_photon_energy(1.5), 6.05);
    EXPECT_DOUBLE_EQ(estimate_photon_energy(6.4), 10.897);
    EXPECT_DOUBLE_EQ(estimate_photon_energy(95.6), 95.6 + DEFAULT_WORK_FUNCTION);
}

TEST(PolynomialFit, RecoversCubic) {
    std::vector<double> x, y;
    for (int i = -5; i <= 5; ++i) {
        x.push_back(i);
        y.push_back(1.0 - 2.0 * i + 0.5 * i * i + 0.1 * i * i * i);
    }
    auto coefficients = fit_polynomial(x, y, 3);
    ASSERT_EQ(coefficients.size(), 4);
    EXPECT_NEAR(coefficients[0], 1.0, 1e-9);
    EXPECT_NEAR(coefficients[1], -2.0, 1e-9);
    EXPECT_NEAR(coefficients[2], 0.5, 1e-9);
    EXPECT_NEAR(coefficients[3], 0.1, 1e-9);
    EXPECT_NEAR(evaluate_polynomial(coefficients, 2.0), 1.0 - 4.0 + 2.0 + 0.8, 1e-9);
}

TEST(PolynomialFit, DegreeIsLimitedBySamples) {
    std::vector<double> x{1.0, 2.0};
    std::vector<double> y{3.0, 5.0};
    auto coefficients = fit_polynomial(x, y, 3);
    ASSERT_EQ(coefficients.size(), 2);
    EXPECT_NEAR(coefficients[0], 1.0, 1e-12);
    EXPECT_NEAR(coefficients[1], 2.0, 1e-12);
}

TEST(GaussianSmooth, PreservesConstant) {
    std::vector<double> values(20, 3.0);
    for (double v : gaussian_smooth(values, 2.0)) {
        EXPECT_NEAR(v, 3.0, 1e-12);
    }
}
