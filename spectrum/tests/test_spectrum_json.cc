#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <limits>
#include <nlohmann/json.hpp>

#include "spectrum/spectrum_json.hpp"

TEST(SpectrumJson, ReadsFlatDataWithNulls) {
    auto data = json::parse(R"({
        "axes": [{"name": "eV", "values": [16.0, 16.1]},
                 {"name": "theta_par", "values": [-1.0, 0.0, 1.0]}],
        "data": [1, 2, 3, 4, null, 6],
        "metadata": {"beamline": "i05", "hv": 21.2, "polar": 3.5,
                     "EF_correction": 16.8, "eV_type": "kinetic"}
    })");
    auto spectrum = spectrum_from_json(data);
    EXPECT_EQ(spectrum.shape(), (std::vector<size_t>{2, 3}));
    EXPECT_TRUE(std::isnan(spectrum.data()[4]));
    EXPECT_DOUBLE_EQ(spectrum.data()[5], 6.0);

    auto &metadata = spectrum.metadata();
    EXPECT_EQ(metadata.beamline, "i05");
    EXPECT_EQ(metadata.hv, 21.2);
    EXPECT_EQ(metadata.angles.polar, 3.5);
    EXPECT_FALSE(metadata.angles.tilt.has_value());
    ASSERT_TRUE(std::holds_alternative<ConstantReference>(metadata.EF_correction));
    EXPECT_DOUBLE_EQ(std::get<ConstantReference>(metadata.EF_correction).fermi_level, 16.8);
}

TEST(SpectrumJson, WritesNaNAsNullAndReadsItBack) {
    auto nan = std::numeric_limits<double>::quiet_NaN();
    SpectrumMetadata metadata;
    metadata.eV_type = EnergyScale::Binding;
    metadata.EF_correction = PolynomialReference{{16.8, 0.001}};
    metadata.KE_delta = {0.0, 0.5};
    metadata.scalars["k_perp"] = 0.25;
    metadata.history.push_back("Binned by {eV: 2}");
    Spectrum spectrum({{"eV", {-0.1, 0.0}}, {"hv", {20.0, 21.0}}}, {1.0, nan, 3.0, 4.0}, metadata);

    auto data = spectrum_to_json(spectrum);
    EXPECT_TRUE(data["data"][1].is_null());

    auto restored = spectrum_from_json(data);
    EXPECT_EQ(restored.axis_names(), spectrum.axis_names());
    EXPECT_TRUE(std::isnan(restored.data()[1]));
    EXPECT_EQ(restored.metadata().eV_type, EnergyScale::Binding);
    EXPECT_EQ(restored.metadata().KE_delta, metadata.KE_delta);
    EXPECT_DOUBLE_EQ(restored.metadata().scalars.at("k_perp"), 0.25);
    EXPECT_EQ(restored.metadata().history, metadata.history);
    auto *poly = std::get_if<PolynomialReference>(&restored.metadata().EF_correction);
    ASSERT_NE(poly, nullptr);
    EXPECT_EQ(poly->coefficients, (std::vector<double>{16.8, 0.001}));
}

TEST(SpectrumJson, MissingKeysAreReported) {
    auto data = json::parse(R"({"axes": []})");
    EXPECT_THROW(spectrum_from_json(data), std::invalid_argument);
    auto bad_axis = json::parse(R"({"axes": [{"name": "eV"}], "data": [1]})");
    EXPECT_THROW(spectrum_from_json(bad_axis), std::invalid_argument);
}

TEST(SpectrumJson, SizeMismatchIsRejected) {
    auto data = json::parse(R"({"axes": [{"name": "eV", "values": [1, 2]}], "data": [1]})");
    EXPECT_THROW(spectrum_from_json(data), std::invalid_argument);
}

TEST(SpectrumJson, UnreadableFileThrows) {
    EXPECT_THROW(load_spectrum(std::filesystem::path("/nonexistent/spectrum.json")),
                 std::runtime_error);
}
