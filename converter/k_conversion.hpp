/**
 * @file k_conversion.hpp
 * @brief Entry point of the conversion engine and the angle to momentum
 * resampling of dispersions and maps.
 */
#pragma once

#include "conversion_context.hpp"
#include "conversion_options.hpp"
#include "conversion_warnings.hpp"
#include "geometry/beamline_convention.hpp"
#include "spectrum/spectrum.hpp"

/**
 * @brief Convert a spectrum to momentum and/or binding energy.
 *
 * Dispatches on the shape of the spectrum and the requested target:
 * photon energy scans go through the kz conversion, convert = q through
 * the momentum transfer conversion, convert = BE through the binding
 * energy conversion and everything else through convert_to_k. The input
 * is never modified.
 *
 * @param spectrum Source spectrum in detector coordinates
 * @param options Call-time options, validated before any work is done
 * @param convention Beamline sign conventions
 * @throws ConversionError (or a subclass) for any fatal condition
 */
ConversionResult convert(const Spectrum &spectrum,
                         const ConversionOptions &options = {},
                         const BeamlineConvention &convention = {});

/**
 * @brief Resample a dispersion (theta_par, eV) or a map (mapping angle,
 * theta_par, eV) onto a regular momentum grid.
 *
 * Expects a prepared, binned input with increasing axes. The output
 * keeps the input axis order with theta_par renamed k_par and the
 * mapping axis renamed k_perp. A dispersion carries its (near constant)
 * k_perp as a scalar coordinate.
 */
Spectrum convert_to_k(const Spectrum &spectrum,
                      const ConversionOptions &options,
                      const BeamlineConvention &convention,
                      ConversionWarnings &warnings);

/**
 * @brief Replace the kinetic energy axis by binding energy, keeping the
 * angular axes.
 *
 * Each output cell is sampled at KE = BE + EF(theta_par), so an angle
 * dependent Fermi level straightens out.
 */
Spectrum convert_to_binding_energy(const Spectrum &spectrum,
                                   const ConversionOptions &options,
                                   ConversionWarnings &warnings);
