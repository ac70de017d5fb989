/**
 * @file q_conversion.hpp
 * @brief Momentum transfer conversion of electron energy loss dispersions.
 *
 * The spectrometer has a fixed total scattering angle of 135 degrees; the
 * sample polar angle p sets the incidence angle a = 135 - p. An electron
 * of primary energy E0 (stored as hv) scattered into analyser angle
 * theta_par with kinetic energy KE transfers
 *
 *   q = C sqrt(E0) (sin(a) - sqrt(KE / E0) sin(theta_par + 135 - a))
 *
 * parallel to the surface.
 */
#pragma once

#include "conversion_options.hpp"
#include "conversion_warnings.hpp"
#include "spectrum/spectrum.hpp"

/// Total scattering angle of the spectrometer, degrees
constexpr double SCATTERING_ANGLE = 135.0;

/// Momentum transfer at analyser angle theta_par (degrees)
double momentum_transfer(double theta_par,
                         double kinetic_energy,
                         double primary_energy,
                         double incidence);

/// Analyser angle (degrees) of momentum transfer q, NaN when unreachable
double momentum_transfer_angle(double q,
                               double kinetic_energy,
                               double primary_energy,
                               double incidence);

/**
 * @brief Resample a (theta_par, eV) dispersion onto momentum transfer.
 *
 * The output replaces theta_par by q, keeps the energy axis and the
 * input axis order.
 *
 * @throws ConfigurationError if the primary energy or sample polar angle
 * is missing, or the spectrum is not a dispersion
 */
Spectrum convert_to_q(const Spectrum &spectrum,
                      const ConversionOptions &options,
                      ConversionWarnings &warnings);
