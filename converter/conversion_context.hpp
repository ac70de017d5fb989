/**
 * @file conversion_context.hpp
 * @brief Steps shared by every conversion: option overrides, binning
 * policy, energy reference resolution and energy selection.
 */
#pragma once

#include <map>
#include <string>
#include <vector>

#include "conversion_options.hpp"
#include "conversion_warnings.hpp"
#include "energy/energy_reference.hpp"
#include "spectrum/spectrum.hpp"

/// Converted spectrum together with the advisory messages raised on the way
struct ConversionResult {
    Spectrum spectrum;
    std::vector<std::string> warnings;
};

/// Input size (elements) above which binning is applied automatically
constexpr size_t AUTO_BIN_THRESHOLD = 10'000'000;

/**
 * @brief Copy of the input with the call-time overrides in its metadata
 * and every axis increasing.
 */
Spectrum prepare_input(const Spectrum &spectrum, const ConversionOptions &options);

/**
 * @brief Apply explicit, shorthand or automatic binning.
 *
 * A bin_factor of 1 disables binning altogether. Automatic binning
 * (2 x 2 over eV and theta_par) happens above AUTO_BIN_THRESHOLD and
 * leaves the energy axis alone when a single energy slice is requested.
 */
Spectrum apply_binning(const Spectrum &spectrum,
                       const ConversionOptions &options,
                       ConversionWarnings &warnings);

/// Sum over every axis except eV, ignoring NaN
std::vector<double> integrated_edc(const Spectrum &spectrum);

/**
 * @brief Resolve the Fermi level reference of a spectrum, estimating any
 * missing part from the data.
 *
 * A missing Fermi level correction is replaced by a constant estimate from
 * the integrated EDC, a missing photon energy by the photon energy
 * heuristic. Each substitution adds a warning.
 */
ResolvedEnergyReference resolve_reference_or_estimate(const Spectrum &spectrum,
                                                      ConversionWarnings &warnings);

/// Output energies after applying the eV or FS selector
struct EnergySelection {
    enum class Reduction { None, Squeeze, Mean };
    std::vector<double> values;
    Reduction reduction = Reduction::None;
};

/**
 * @brief Apply the eV or FS selector to an output energy axis.
 *
 * @param axis The full output energy axis (increasing)
 * @param options Conversion options holding the selectors
 * @param fermi_level Centre of an FS selection that gives none, on the
 *   scale of the axis
 * @throws ConfigurationError if a window selects nothing
 */
EnergySelection select_energies(const std::vector<double> &axis,
                                const ConversionOptions &options,
                                double fermi_level = 0.0);

/// Squeeze or average the eV axis as the selection requires
Spectrum reduce_energy(const Spectrum &spectrum, const EnergySelection &selection);

/**
 * @brief Axis names of the input with converted names substituted.
 *
 * Used to give the output the same axis order as the input.
 */
std::vector<std::string> substituted_order(const Spectrum &input,
                                           const std::map<std::string, std::string> &renames);
