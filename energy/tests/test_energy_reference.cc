#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <vector>

#include "energy/energy_reference.hpp"
#include "kconv_errors.hpp"

namespace {
const std::vector<double> theta{-10.0, -5.0, 0.0, 5.0, 10.0};
}

TEST(EnergyReference, ConstantShiftIsZero) {
    auto resolved = resolve_energy_reference(ConstantReference{16.8}, theta, 21.2);
    EXPECT_DOUBLE_EQ(resolved.fermi_level(3.0), 16.8);
    EXPECT_DOUBLE_EQ(resolved.shift(-10.0), 0.0);
    EXPECT_NEAR(resolved.work_function(), 4.4, 1e-12);
    EXPECT_EQ(resolved.history(), "Fermi level corrected by a rigid shift");
}

TEST(EnergyReference, PolynomialIsEvaluatedInAngle) {
    // EF = 16.8 - 0.001 theta^2, highest at normal emission
    auto resolved =
      resolve_energy_reference(PolynomialReference{{16.8, 0.0, -0.001}}, theta, 21.2);
    EXPECT_DOUBLE_EQ(resolved.max_fermi_level(), 16.8);
    EXPECT_NEAR(resolved.min_fermi_level(), 16.7, 1e-12);
    EXPECT_NEAR(resolved.shift(10.0), -0.1, 1e-12);
    EXPECT_NEAR(resolved.fermi_level(5.0), 16.775, 1e-12);
    EXPECT_EQ(resolved.history(), "Fermi level corrected by a quadratic fit");
}

TEST(EnergyReference, PolynomialDegreeIsLimited) {
    EXPECT_THROW(resolve_energy_reference(
                   PolynomialReference{{16.8, 0.0, 0.0, 0.0, 1e-6}}, theta, 21.2),
                 ConfigurationError);
    EXPECT_THROW(resolve_energy_reference(PolynomialReference{}, theta, 21.2),
                 ConfigurationError);
}

TEST(EnergyReference, SampledIsSortedAndExtrapolated) {
    SampledReference sampled{{5.0, -5.0, 0.0}, {16.9, 16.7, 16.8}};
    auto resolved = resolve_energy_reference(sampled, theta, 21.2);
    EXPECT_NEAR(resolved.fermi_level(2.5), 16.85, 1e-12);
    // Linear extrapolation beyond the sampled range
    EXPECT_NEAR(resolved.fermi_level(10.0), 17.0, 1e-12);
    EXPECT_NEAR(resolved.max_fermi_level(), 17.0, 1e-12);
    EXPECT_EQ(resolved.history(), "Fermi level corrected by an array");
}

TEST(EnergyReference, SampledRejectsMismatchedLengths) {
    SampledReference sampled{{0.0, 1.0}, {16.8}};
    EXPECT_THROW(resolve_energy_reference(sampled, theta, 21.2), ConfigurationError);
    SampledReference duplicate{{0.0, 0.0}, {16.8, 16.9}};
    EXPECT_THROW(resolve_energy_reference(duplicate, theta, 21.2), ConfigurationError);
}

TEST(EnergyReference, UniformSampledMatchesConstant) {
    SampledReference sampled{theta, std::vector<double>(theta.size(), 16.8)};
    auto a = resolve_energy_reference(sampled, theta, 21.2);
    auto b = resolve_energy_reference(ConstantReference{16.8}, theta, 21.2);
    for (double t : {-12.0, -3.3, 0.0, 7.5}) {
        EXPECT_DOUBLE_EQ(a.fermi_level(t), b.fermi_level(t));
        EXPECT_DOUBLE_EQ(a.shift(t), b.shift(t));
    }
}

TEST(EnergyReference, MissingReferenceOrPhotonEnergy) {
    EXPECT_THROW(resolve_energy_reference(NoReference{}, theta, 21.2), MissingReferenceError);
    EXPECT_THROW(resolve_energy_reference(ConstantReference{16.8}, theta, std::nullopt),
                 MissingReferenceError);
}

TEST(EnergyReference, JsonForms) {
    EXPECT_TRUE(std::holds_alternative<NoReference>(energy_reference_from_json(nullptr)));

    auto constant = energy_reference_from_json(json(16.8));
    ASSERT_TRUE(std::holds_alternative<ConstantReference>(constant));

    auto poly = energy_reference_from_json(json::parse(R"({"coefficients": [16.8, 0.01]})"));
    ASSERT_TRUE(std::holds_alternative<PolynomialReference>(poly));
    EXPECT_EQ(std::get<PolynomialReference>(poly).coefficients.size(), 2);

    auto sampled = energy_reference_from_json(
      json::parse(R"({"theta_par": [-1, 1], "EF": [16.7, 16.9]})"));
    ASSERT_TRUE(std::holds_alternative<SampledReference>(sampled));

    EXPECT_THROW(energy_reference_from_json(json::parse(R"({"offset": 1})")),
                 std::invalid_argument);
    EXPECT_THROW(energy_reference_from_json(json("16.8")), std::invalid_argument);
}

TEST(EnergyReference, InterpolateExtrapolate) {
    std::vector<double> x{0.0, 1.0, 3.0};
    std::vector<double> y{0.0, 2.0, 4.0};
    EXPECT_DOUBLE_EQ(interpolate_extrapolate(x, y, 0.5), 1.0);
    EXPECT_DOUBLE_EQ(interpolate_extrapolate(x, y, 2.0), 3.0);
    EXPECT_DOUBLE_EQ(interpolate_extrapolate(x, y, -1.0), -2.0);
    EXPECT_DOUBLE_EQ(interpolate_extrapolate(x, y, 5.0), 6.0);
}
