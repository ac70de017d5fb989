#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "converter/k_conversion.hpp"
#include "converter/q_conversion.hpp"
#include "geometry/momentum_mapping.hpp"
#include "kconv_errors.hpp"
#include "spectrum/sample_data.hpp"

namespace {

/// Loss spectrum at 100 eV primary energy, polar angle given in degrees
Spectrum make_loss_spectrum(double polar) {
    Axis eV{"eV", linspace(95, 100, 11)};
    Axis theta{"theta_par", linspace(-10, 10, 21)};
    std::vector<double> data;
    for (double E : eV.values) {
        for (double t : theta.values) {
            data.push_back(E + 0.1 * t);
        }
    }
    SpectrumMetadata metadata;
    metadata.hv = 100.0;
    metadata.angles.polar = polar;
    return Spectrum({eV, theta}, std::move(data), std::move(metadata));
}

ConversionOptions q_options() {
    ConversionOptions options;
    options.convert = ConversionTarget::Target::MomentumTransfer;
    return options;
}

}  // namespace

TEST(MomentumTransfer, SpecularGeometry) {
    // polar 60: incidence 75, the analyser centre sits at 60 degrees
    double q = momentum_transfer(0.0, 100.0, 100.0, 75.0);
    double expected = KVAC_CONST * 10.0 * (std::sin(75 * M_PI / 180) - std::sin(60 * M_PI / 180));
    EXPECT_NEAR(q, expected, 1e-12);
    // Elastic scattering at the mirror angle transfers no momentum
    EXPECT_NEAR(momentum_transfer(15.0, 100.0, 100.0, 75.0), 0.0, 1e-12);
}

TEST(MomentumTransfer, AngleInvertsTransfer) {
    for (double theta : {-10.0, -2.5, 0.0, 7.0}) {
        for (double KE : {95.0, 99.0}) {
            double q = momentum_transfer(theta, KE, 100.0, 75.0);
            EXPECT_NEAR(momentum_transfer_angle(q, KE, 100.0, 75.0), theta, 1e-9);
        }
    }
    EXPECT_TRUE(std::isnan(momentum_transfer_angle(50.0, 95.0, 100.0, 75.0)));
}

TEST(QConversion, ConvertsDispersion) {
    auto result = convert(make_loss_spectrum(60.0), q_options());
    const auto &spectrum = result.spectrum;
    EXPECT_EQ(spectrum.axis_names(), (std::vector<std::string>{"eV", "q"}));
    EXPECT_TRUE(spectrum.axis("q").is_increasing());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(spectrum.metadata().history.back().rfind("Converted into q space", 0), 0);

    // Intensity at q recovers the angle it came from
    const auto &q = spectrum.axis("q").values;
    size_t middle = q.size() / 2;
    double theta = momentum_transfer_angle(q[middle], 100.0, 100.0, 75.0);
    auto view = spectrum.view<2>({"eV", "q"});
    double value = view.data_handle()[10 * view.stride(0) + middle * view.stride(1)];
    EXPECT_NEAR(value, 100.0 + 0.1 * theta, 1e-9);
}

TEST(QConversion, WarnsForUnphysicalIncidence) {
    auto result = convert(make_loss_spectrum(0.0), q_options());
    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_NE(result.warnings[0].find("incidence"), std::string::npos);
}

TEST(QConversion, WarnsForUnphysicalReflection) {
    auto result = convert(make_loss_spectrum(110.0), q_options());
    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_NE(result.warnings[0].find("reflection"), std::string::npos);
}

TEST(QConversion, SingleEnergy) {
    auto options = q_options();
    options.eV = CoordinateSelector::at(99.0);
    auto result = convert(make_loss_spectrum(60.0), options);
    EXPECT_EQ(result.spectrum.axis_names(), (std::vector<std::string>{"q"}));
    EXPECT_DOUBLE_EQ(result.spectrum.metadata().scalars.at("eV"), 99.0);
}

TEST(QConversion, FermiSurfaceNeedsCentre) {
    auto options = q_options();
    options.FS = FermiSurfaceSelector{1.0, std::nullopt};
    EXPECT_THROW(convert(make_loss_spectrum(60.0), options), ConfigurationError);
    options.FS->centre = 99.0;
    auto result = convert(make_loss_spectrum(60.0), options);
    EXPECT_EQ(result.spectrum.axis_names(), (std::vector<std::string>{"q"}));
    EXPECT_NEAR(result.spectrum.metadata().scalars.at("eV"), 99.0, 1e-9);
}

TEST(QConversion, RequiresPrimaryEnergyAndPolar) {
    auto spectrum = make_loss_spectrum(60.0);
    spectrum.metadata().hv.reset();
    EXPECT_THROW(convert(spectrum, q_options()), ConfigurationError);

    auto no_polar = make_loss_spectrum(60.0);
    no_polar.metadata().angles.polar.reset();
    EXPECT_THROW(convert(no_polar, q_options()), ConfigurationError);
}

TEST(QConversion, OnlyDispersions) {
    EXPECT_THROW(convert(make_sample_map(), q_options()), ConfigurationError);
}
