#include <gtest/gtest.h>

#include <cmath>
#include <tuple>

#include "geometry/momentum_mapping.hpp"

namespace {

constexpr double Ek = 16.8;

/// Geometry with fixed rotations, for exercising the mapper directly
AnalyserGeometry make_geometry(AnalyserType::Type type) {
    AnalyserGeometry geometry;
    geometry.type = type;
    geometry.delta = 7.0;
    geometry.xi = 4.0;
    geometry.xi_0 = 1.0;
    geometry.beta_0 = 0.5;
    geometry.chi = 2.0;
    geometry.chi_0 = -1.0;
    return geometry;
}

class RoundTripTest : public ::testing::TestWithParam<AnalyserType::Type> {};

}  // namespace

TEST(MomentumMapping, VacuumMomentum) {
    EXPECT_NEAR(k_vacuum(1.0), KVAC_CONST, 1e-15);
    EXPECT_NEAR(k_vacuum(16.8), 2.09987, 1e-4);
}

TEST(MomentumMapping, NormalEmissionIsZero) {
    auto k = forward_type_i(0.0, 0.0, 0.0, 0.0, Ek);
    EXPECT_NEAR(k.kx, 0.0, 1e-14);
    EXPECT_NEAR(k.ky, 0.0, 1e-14);
    k = forward_type_ii(0.0, 0.0, 0.0, 0.0, Ek);
    EXPECT_NEAR(k.kx, 0.0, 1e-14);
    EXPECT_NEAR(k.ky, 0.0, 1e-14);
    k = forward_type_ip(0.0, 0.0, 0.0, 0.0, 0.0, Ek);
    EXPECT_NEAR(k.kx, 0.0, 1e-14);
    EXPECT_NEAR(k.ky, 0.0, 1e-14);
}

TEST(MomentumMapping, SlitAngleGivesSineOfAlpha) {
    double kv = k_vacuum(Ek);
    auto k = forward_type_i(15.0, 0.0, 0.0, 0.0, Ek);
    EXPECT_NEAR(std::abs(k.kx), kv * std::sin(15.0 * M_PI / 180.0), 1e-12);
    EXPECT_NEAR(k.ky, 0.0, 1e-12);
    k = forward_type_ii(15.0, 0.0, 0.0, 0.0, Ek);
    EXPECT_NEAR(k.kx, 0.0, 1e-12);
    EXPECT_NEAR(std::abs(k.ky), kv * std::sin(15.0 * M_PI / 180.0), 1e-12);
}

TEST(MomentumMapping, OutsideHorizonIsNaN) {
    double kv = k_vacuum(Ek);
    auto angles = inverse_type_i(kv, 0.5, 0.0, 0.0, 0.0, Ek);
    EXPECT_TRUE(std::isnan(angles.alpha));
    EXPECT_TRUE(std::isnan(angles.beta));
    angles = inverse_type_ip(0.0, 1.1 * kv, 0.0, 0.0, 0.0, Ek);
    EXPECT_TRUE(std::isnan(angles.alpha));
}

TEST(MomentumMapping, DeflectorRotationIsOrthogonal) {
    auto t = deflector_rotation_inverse(12.0, -5.0, 8.0);
    EXPECT_TRUE((t * t.transpose()).isIdentity(1e-12));
}

TEST(MomentumMapping, DeflectorNormalEmissionInverse) {
    auto angles = inverse_type_ip(0.0, 0.0, 0.0, 0.0, 0.0, Ek);
    EXPECT_DOUBLE_EQ(angles.alpha, 0.0);
    EXPECT_DOUBLE_EQ(angles.beta, 0.0);
}

TEST_P(RoundTripTest, InverseRecoversAngles) {
    MomentumMapper mapper(make_geometry(GetParam()));
    for (double alpha : {-14.0, -3.0, 0.0, 6.5, 13.0}) {
        for (double beta : {-8.0, 0.5, 2.0, 9.0}) {
            auto k = mapper.forward(alpha, beta, Ek);
            auto angles = mapper.inverse(k.kx, k.ky, Ek);
            EXPECT_NEAR(angles.alpha, alpha, 1e-6) << "beta " << beta;
            EXPECT_NEAR(angles.beta, beta, 1e-6) << "alpha " << alpha;
        }
    }
}

INSTANTIATE_TEST_SUITE_P(AllAnalyserTypes,
                         RoundTripTest,
                         ::testing::Values(AnalyserType::Type::I,
                                           AnalyserType::Type::II,
                                           AnalyserType::Type::Ip,
                                           AnalyserType::Type::IIp));

TEST(MomentumMapper, SlitComponents) {
    MomentumMapper type_one(make_geometry(AnalyserType::Type::I));
    KVector k{0.3, -0.2};
    EXPECT_DOUBLE_EQ(type_one.along_slit(k), 0.3);
    EXPECT_DOUBLE_EQ(type_one.across_slit(k), -0.2);

    MomentumMapper type_two(make_geometry(AnalyserType::Type::II));
    EXPECT_DOUBLE_EQ(type_two.along_slit(k), -0.2);
    auto rebuilt = type_two.from_slit_components(-0.2, 0.3);
    EXPECT_DOUBLE_EQ(rebuilt.kx, 0.3);
    EXPECT_DOUBLE_EQ(rebuilt.ky, -0.2);
}
