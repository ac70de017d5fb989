#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <vector>

#include "geometry/analyser_geometry.hpp"
#include "kconv_errors.hpp"
#include "spectrum/sample_data.hpp"

namespace {

SpectrumMetadata type_one_metadata() {
    SpectrumMetadata metadata;
    metadata.ana_slit_angle = 90;
    metadata.angles.polar = 3.0;
    metadata.angles.tilt = 1.0;
    metadata.angles.azi = 0.0;
    return metadata;
}

Spectrum dispersion(SpectrumMetadata metadata) {
    return Spectrum::filled(
      {{"eV", {16.0, 16.5}}, {"theta_par", {-2.0, 0.0, 2.0}}}, 1.0, std::move(metadata));
}

}  // namespace

TEST(AnalyserType, ParsesNames) {
    EXPECT_EQ(AnalyserType("I").type, AnalyserType::Type::I);
    EXPECT_EQ(AnalyserType("ii").type, AnalyserType::Type::II);
    EXPECT_EQ(AnalyserType("I'").type, AnalyserType::Type::Ip);
    EXPECT_EQ(AnalyserType("IIp").type, AnalyserType::Type::IIp);
    EXPECT_TRUE(AnalyserType("IIp").has_deflector());
    EXPECT_FALSE(AnalyserType("II").slit_along_kx());
    EXPECT_EQ(AnalyserType(AnalyserType::Type::Ip).to_string(), "Ip");
    EXPECT_THROW(AnalyserType("III"), std::invalid_argument);
    EXPECT_THROW(AnalyserType("I\xE2\x80\xB2"), std::invalid_argument);
}

TEST(AngleMap, InvertsToCoordinate) {
    AngleMap map{-1.0, 2.5};
    EXPECT_DOUBLE_EQ(map.to_angle(4.0), -1.5);
    EXPECT_DOUBLE_EQ(map.to_coordinate(map.to_angle(4.0)), 4.0);
}

TEST(ResolveGeometry, TypeOneDispersion) {
    ConversionWarnings warnings;
    auto geometry =
      resolve_geometry(dispersion(type_one_metadata()), BeamlineConvention(), {}, warnings);
    EXPECT_EQ(geometry.type.type, AnalyserType::Type::I);
    EXPECT_FALSE(geometry.mapping_axis.has_value());
    EXPECT_DOUBLE_EQ(geometry.beta, 3.0);
    // Unset normal emission polar defaults to the current polar
    EXPECT_DOUBLE_EQ(geometry.beta_0, 3.0);
    EXPECT_DOUBLE_EQ(geometry.xi, 1.0);
    EXPECT_DOUBLE_EQ(geometry.xi_0, 0.0);
    EXPECT_EQ(geometry.alpha_values, (std::vector<double>{-2.0, 0.0, 2.0}));
    EXPECT_EQ(warnings.messages().size(), 3);
}

TEST(ResolveGeometry, NormalEmissionFromMetadata) {
    auto metadata = type_one_metadata();
    metadata.angles.norm_polar = 1.0;
    metadata.angles.norm_tilt = 0.5;
    metadata.angles.norm_azi = 0.0;
    ConversionWarnings warnings;
    auto geometry = resolve_geometry(dispersion(metadata), BeamlineConvention(), {}, warnings);
    EXPECT_DOUBLE_EQ(geometry.beta_0, 1.0);
    EXPECT_DOUBLE_EQ(geometry.xi_0, 0.5);
    EXPECT_TRUE(warnings.empty());
}

TEST(ResolveGeometry, OverridesReplaceMetadata) {
    ManipulatorAngles overrides;
    overrides.polar = -4.0;
    ConversionWarnings warnings;
    auto geometry =
      resolve_geometry(dispersion(type_one_metadata()), BeamlineConvention(), overrides, warnings);
    EXPECT_DOUBLE_EQ(geometry.beta, -4.0);
}

TEST(ResolveGeometry, TypeTwoUsesTilt) {
    auto metadata = type_one_metadata();
    metadata.ana_slit_angle = 0;
    ConversionWarnings warnings;
    auto geometry = resolve_geometry(dispersion(metadata), BeamlineConvention(), {}, warnings);
    EXPECT_EQ(geometry.type.type, AnalyserType::Type::II);
    EXPECT_DOUBLE_EQ(geometry.beta, 1.0);
    EXPECT_DOUBLE_EQ(geometry.xi, 3.0);
}

TEST(ResolveGeometry, PolarMap) {
    auto map = make_sample_map();
    ConversionWarnings warnings;
    auto geometry = resolve_geometry(map, BeamlineConvention(), {}, warnings);
    EXPECT_EQ(geometry.type.type, AnalyserType::Type::I);
    ASSERT_TRUE(geometry.mapping_axis.has_value());
    EXPECT_EQ(*geometry.mapping_axis, "polar");
    EXPECT_EQ(geometry.beta_values.size(), map.axis("polar").size());
    EXPECT_DOUBLE_EQ(geometry.beta_map.to_coordinate(geometry.beta_values.back()), 10.0);
}

TEST(ResolveGeometry, DeflectorMap) {
    auto metadata = type_one_metadata();
    metadata.angles.defl_par = 1.5;
    auto map = Spectrum::filled(
      {{"defl_perp", {-5.0, 0.0, 5.0}}, {"eV", {16.0, 16.5}}, {"theta_par", {-2.0, 2.0}}},
      1.0,
      metadata);
    ConversionWarnings warnings;
    auto geometry = resolve_geometry(map, BeamlineConvention(), {}, warnings);
    EXPECT_EQ(geometry.type.type, AnalyserType::Type::Ip);
    ASSERT_TRUE(geometry.mapping_axis.has_value());
    EXPECT_EQ(*geometry.mapping_axis, "defl_perp");
    EXPECT_EQ(geometry.beta_values, (std::vector<double>{-5.0, 0.0, 5.0}));
    // defl_par offsets alpha, polar becomes chi
    EXPECT_EQ(geometry.alpha_values, (std::vector<double>{-0.5, 3.5}));
    EXPECT_DOUBLE_EQ(geometry.chi, 3.0);
}

TEST(ResolveGeometry, ConventionSignsApply) {
    BeamlineConvention convention;
    convention.theta_par = -1;
    convention.polar = -1;
    ConversionWarnings warnings;
    auto geometry = resolve_geometry(dispersion(type_one_metadata()), convention, {}, warnings);
    EXPECT_EQ(geometry.alpha_values, (std::vector<double>{2.0, 0.0, -2.0}));
    EXPECT_DOUBLE_EQ(geometry.beta, -3.0);
}

TEST(ResolveGeometry, MissingSlitOrientation) {
    auto metadata = type_one_metadata();
    metadata.ana_slit_angle.reset();
    ConversionWarnings warnings;
    EXPECT_THROW(resolve_geometry(dispersion(metadata), BeamlineConvention(), {}, warnings),
                 ConfigurationError);
    metadata.ana_slit_angle = 45;
    EXPECT_THROW(resolve_geometry(dispersion(metadata), BeamlineConvention(), {}, warnings),
                 ConfigurationError);
}

TEST(ResolveGeometry, MissingManipulatorAngle) {
    auto metadata = type_one_metadata();
    metadata.angles.polar.reset();
    ConversionWarnings warnings;
    EXPECT_THROW(resolve_geometry(dispersion(metadata), BeamlineConvention(), {}, warnings),
                 ConfigurationError);
}

TEST(ResolveGeometry, UnsupportedMappingAxis) {
    // A tilt map on a type I analyser cannot drive beta
    auto spectrum = Spectrum::filled(
      {{"tilt", {-1.0, 1.0}}, {"eV", {16.0, 16.5}}, {"theta_par", {-2.0, 2.0}}},
      1.0,
      type_one_metadata());
    ConversionWarnings warnings;
    EXPECT_THROW(resolve_geometry(spectrum, BeamlineConvention(), {}, warnings),
                 UnsupportedGeometryError);

    auto unknown = Spectrum::filled(
      {{"temperature", {10.0, 20.0}}, {"eV", {16.0, 16.5}}, {"theta_par", {-2.0, 2.0}}},
      1.0,
      type_one_metadata());
    EXPECT_THROW(find_mapping_axis(unknown), UnsupportedGeometryError);
}

TEST(BeamlineConvention, LoadsFromJson) {
    auto data = json::parse(R"({"name": "i05", "theta_par": -1, "polar": 1, "tilt": 1,
        "azi": 1, "defl_par": 1, "defl_perp": -1, "ana_polar": 0})");
    BeamlineConvention convention(data);
    EXPECT_EQ(convention.name, "i05");
    EXPECT_DOUBLE_EQ(convention.theta_par, -1.0);
    EXPECT_DOUBLE_EQ(convention.defl_perp, -1.0);
    EXPECT_EQ(convention.to_json(), data);
}

TEST(BeamlineConvention, MissingKey) {
    auto data = json::parse(R"({"theta_par": 1, "polar": 1})");
    EXPECT_THROW(BeamlineConvention{data}, std::invalid_argument);
}
