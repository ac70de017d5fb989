#include "q_conversion.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "conversion_context.hpp"
#include "geometry/momentum_mapping.hpp"
#include "grid_bounds.hpp"
#include "interpolation.hpp"
#include "kconv_errors.hpp"

namespace {
constexpr double DEG2RAD = M_PI / 180.0;
constexpr double RAD2DEG = 180.0 / M_PI;
}  // namespace

double momentum_transfer(double theta_par,
                         double kinetic_energy,
                         double primary_energy,
                         double incidence) {
    double scattered = (theta_par + SCATTERING_ANGLE - incidence) * DEG2RAD;
    return KVAC_CONST * std::sqrt(primary_energy)
           * (std::sin(incidence * DEG2RAD)
              - std::sqrt(kinetic_energy / primary_energy) * std::sin(scattered));
}

double momentum_transfer_angle(double q,
                               double kinetic_energy,
                               double primary_energy,
                               double incidence) {
    double ratio = std::sqrt(primary_energy / kinetic_energy)
                   * (std::sin(incidence * DEG2RAD)
                      - q / (KVAC_CONST * std::sqrt(primary_energy)));
    if (!(std::abs(ratio) <= 1.0)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::asin(ratio) * RAD2DEG + incidence - SCATTERING_ANGLE;
}

Spectrum convert_to_q(const Spectrum &spectrum,
                      const ConversionOptions &options,
                      ConversionWarnings &warnings) {
    if (spectrum.ndim() != 2) {
        throw ConfigurationError(
          "Momentum transfer conversion needs a (theta_par, eV) dispersion");
    }
    const auto &metadata = spectrum.metadata();
    if (!metadata.hv) {
        throw ConfigurationError("Primary beam energy (hv) is required for q conversion");
    }
    if (!metadata.angles.polar) {
        throw ConfigurationError("Sample polar angle is required for q conversion");
    }
    double E0 = *metadata.hv;
    double incidence = SCATTERING_ANGLE - *metadata.angles.polar;

    const auto &theta = spectrum.axis("theta_par");
    const auto &eV = spectrum.axis("eV");
    if (SCATTERING_ANGLE + theta.values.front() - incidence > 90) {
        warnings.warn(
          "Angle of reflection is greater than 90 degrees, geometry is not physical");
    } else if (incidence > 90) {
        warnings.warn(
          "Angle of incidence is greater than 90 degrees, geometry is not physical");
    }

    if (options.FS && !options.FS->centre) {
        throw ConfigurationError(
          "An FS selection on a kinetic energy loss spectrum needs an explicit centre");
    }
    auto selection = select_energies(eV.values, options);
    auto [lowest, highest] =
      std::minmax_element(selection.values.begin(), selection.values.end());

    MomentumRange range{std::numeric_limits<double>::infinity(),
                        -std::numeric_limits<double>::infinity()};
    for (double t : {theta.values.front(), theta.values.back()}) {
        for (double KE : {*lowest, *highest}) {
            double q = momentum_transfer(t, KE, E0, incidence);
            if (std::isnan(q)) continue;
            range.min = std::min(range.min, q);
            range.max = std::max(range.max, q);
        }
    }
    if (!(range.max >= range.min)) {
        throw ConfigurationError("No sampled angle maps to a real momentum transfer");
    }
    double dq = options.dk.value_or(matching_step(range, theta.size()));
    Axis q_axis{"q", make_axis(range.min, range.max, dq)};
    Axis energy{"eV", selection.values};

    GridInterpolator<2> source(spectrum, {"eV", "theta_par"});
    std::vector<double> data;
    data.reserve(energy.size() * q_axis.size());
    for (double KE : energy.values) {
        for (double q : q_axis.values) {
            double t = momentum_transfer_angle(q, KE, E0, incidence);
            data.push_back(std::isnan(t) ? t : source({KE, t}));
        }
    }

    SpectrumMetadata converted_metadata = metadata;
    converted_metadata.history.push_back(fmt::format(
      "Converted into q space, incidence angle {} degrees, dq = {:.4f}", incidence, dq));
    Spectrum converted({energy, q_axis}, std::move(data), std::move(converted_metadata));
    return reduce_energy(
      transpose(converted, substituted_order(spectrum, {{"theta_par", "q"}})), selection);
}
