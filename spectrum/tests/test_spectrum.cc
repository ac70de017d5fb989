#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "spectrum/spectrum.hpp"

namespace {

/// 2x3 spectrum over (eV, theta_par) holding 10 * i + j
Spectrum make_grid() {
    std::vector<Axis> axes{{"eV", {16.0, 16.5}}, {"theta_par", {-1.0, 0.0, 1.0}}};
    std::vector<double> data;
    for (size_t i = 0; i < 2; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            data.push_back(10.0 * i + j);
        }
    }
    return Spectrum(axes, data);
}

}  // namespace

TEST(Spectrum, RejectsMismatchedBuffer) {
    std::vector<Axis> axes{{"eV", {1.0, 2.0}}, {"theta_par", {0.0, 1.0}}};
    EXPECT_THROW(Spectrum(axes, std::vector<double>(3)), std::invalid_argument);
}

TEST(Spectrum, RejectsRepeatedAxisNames) {
    std::vector<Axis> axes{{"eV", {1.0, 2.0}}, {"eV", {0.0, 1.0}}};
    EXPECT_THROW(Spectrum(axes, std::vector<double>(4)), std::invalid_argument);
}

TEST(Spectrum, ShapeAndStrides) {
    auto spectrum = make_grid();
    EXPECT_EQ(spectrum.shape(), (std::vector<size_t>{2, 3}));
    EXPECT_EQ(spectrum.strides(), (std::vector<size_t>{3, 1}));
    EXPECT_EQ(spectrum.stride("eV"), 3);
    EXPECT_FALSE(spectrum.has_axis("hv"));
    EXPECT_THROW(spectrum.axis("hv"), std::out_of_range);
}

TEST(Spectrum, StridedViewFollowsRequestedOrder) {
    auto spectrum = make_grid();
    auto view = spectrum.view<2>({"theta_par", "eV"});
    EXPECT_EQ(view.extent(0), 3);
    EXPECT_EQ(view.extent(1), 2);
    EXPECT_EQ(view.stride(0), 1);
    EXPECT_EQ(view.stride(1), 3);
    // theta index 2, eV index 1
    EXPECT_DOUBLE_EQ(view.data_handle()[2 * view.stride(0) + 1 * view.stride(1)], 12.0);
}

TEST(Spectrum, TransposeKeepsValuesAtCoordinates) {
    auto spectrum = make_grid();
    auto transposed = transpose(spectrum, {"theta_par", "eV"});
    EXPECT_EQ(transposed.axis_names(), (std::vector<std::string>{"theta_par", "eV"}));
    for (size_t i = 0; i < 2; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            std::vector<size_t> original{i, j};
            std::vector<size_t> swapped{j, i};
            EXPECT_DOUBLE_EQ(spectrum.at(original), transposed.at(swapped));
        }
    }
    EXPECT_THROW(transpose(spectrum, {"eV"}), std::invalid_argument);
}

TEST(Spectrum, EnsureIncreasingReversesAxisAndData) {
    std::vector<Axis> axes{{"eV", {16.0, 16.5}}, {"theta_par", {1.0, 0.0, -1.0}}};
    Spectrum spectrum(axes, {0, 1, 2, 10, 11, 12});
    auto result = ensure_increasing(spectrum);
    EXPECT_TRUE(result.axis("theta_par").is_increasing());
    EXPECT_DOUBLE_EQ(result.axis("theta_par").values[0], -1.0);
    std::vector<size_t> index{1, 0};
    EXPECT_DOUBLE_EQ(result.at(index), 12.0);
    index = {0, 2};
    EXPECT_DOUBLE_EQ(result.at(index), 0.0);
}

TEST(Spectrum, EnsureIncreasingRejectsUnorderedAxis) {
    std::vector<Axis> axes{{"eV", {16.0, 16.5}}, {"theta_par", {-1.0, 1.0, 0.0, 2.0}}};
    Spectrum spectrum(axes, std::vector<double>(8, 1.0));
    EXPECT_THROW(ensure_increasing(spectrum), std::invalid_argument);

    std::vector<Axis> repeated{{"eV", {17.0, 16.5, 16.5, 16.0}}};
    EXPECT_THROW(ensure_increasing(Spectrum(repeated, {1, 2, 3, 4})), std::invalid_argument);
}

TEST(Spectrum, SqueezeKeepsScalarCoordinate) {
    std::vector<Axis> axes{{"eV", {16.25}}, {"theta_par", {-1.0, 0.0, 1.0}}};
    Spectrum spectrum(axes, {1, 2, 3});
    auto squeezed = squeeze(spectrum, "eV");
    EXPECT_EQ(squeezed.ndim(), 1);
    EXPECT_DOUBLE_EQ(squeezed.metadata().scalars.at("eV"), 16.25);
    EXPECT_THROW(squeeze(make_grid(), "eV"), std::invalid_argument);
}

TEST(Spectrum, MeanOverSkipsNaN) {
    auto nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<Axis> axes{{"eV", {16.0, 17.0}}, {"theta_par", {-1.0, 1.0}}};
    Spectrum spectrum(axes, {1.0, nan, 3.0, nan});
    auto mean = mean_over(spectrum, "eV");
    EXPECT_EQ(mean.axis_names(), (std::vector<std::string>{"theta_par"}));
    EXPECT_DOUBLE_EQ(mean.data()[0], 2.0);
    EXPECT_TRUE(std::isnan(mean.data()[1]));
    EXPECT_DOUBLE_EQ(mean.metadata().scalars.at("eV"), 16.5);
}

TEST(Spectrum, AxisHelpers) {
    Axis axis{"eV", {1.0, 1.5, 2.0, 2.5}};
    EXPECT_TRUE(axis.is_increasing());
    EXPECT_TRUE(axis.is_linear());
    EXPECT_DOUBLE_EQ(axis.step(), 0.5);
    EXPECT_EQ(axis.nearest(1.7), 1);
    EXPECT_EQ(axis.nearest(10.0), 3);

    Axis uneven{"theta_par", {0.0, 1.0, 3.0}};
    EXPECT_FALSE(uneven.is_linear());
}

TEST(ManipulatorAngles, UpdateOnlyReplacesSetAngles) {
    ManipulatorAngles angles;
    angles.polar = 5.0;
    angles.tilt = 1.0;
    ManipulatorAngles overrides;
    overrides.tilt = -2.0;
    angles.update(overrides);
    EXPECT_EQ(angles.get("polar"), 5.0);
    EXPECT_EQ(angles.get("tilt"), -2.0);
    EXPECT_FALSE(angles.get("azi").has_value());
    EXPECT_THROW(angles.get("roll"), std::out_of_range);
}

TEST(EnergyScale, ParsesNames) {
    EXPECT_EQ(energy_scale_from_string("kinetic"), EnergyScale::Kinetic);
    EXPECT_EQ(energy_scale_from_string("binding"), EnergyScale::Binding);
    EXPECT_EQ(to_string(EnergyScale::Binding), "binding");
    EXPECT_THROW(energy_scale_from_string("potential"), std::invalid_argument);
}
