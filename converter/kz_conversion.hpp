/**
 * @file kz_conversion.hpp
 * @brief Conversion of photon energy scans (hv, eV, theta_par) to
 * (kz, BE, k_par).
 *
 * The conversion runs as three resampling passes that must be taken in
 * order:
 *
 *   RawHvCube -> EnergyCorrected -> MomentumConverted -> KzConverted
 *
 * The first pass aligns every photon energy to a common binding energy
 * axis using the per-hv Fermi level, the second replaces theta_par by
 * k_par at the kinetic energy of each hv, and the third resamples the hv
 * axis onto kz assuming a free-electron final state with inner potential
 * V0:
 *
 *   kz = C sqrt(V0 + KE - (k_par^2 + k_perp^2) / C^2),  KE = EF(hv) + BE
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "conversion_context.hpp"
#include "conversion_options.hpp"
#include "conversion_warnings.hpp"
#include "geometry/beamline_convention.hpp"
#include "spectrum/spectrum.hpp"

class KzConverter {
  public:
    enum class Stage { RawHvCube, EnergyCorrected, MomentumConverted, KzConverted };

    /**
     * @brief Prepare a photon energy scan for conversion.
     *
     * Resolves the per-hv Fermi level from EF_vs_hv or, when absent,
     * estimates it from the data.
     *
     * @throws UnsupportedGeometryError unless the axes are exactly hv, eV
     * and theta_par
     * @throws ConfigurationError if the scan is not in kinetic energy or
     * per-hv metadata does not match the hv axis
     */
    KzConverter(const Spectrum &cube,
                const ConversionOptions &options,
                const BeamlineConvention &convention,
                ConversionWarnings &warnings);

    Stage stage() const {
        return _stage;
    }
    /// Working spectrum with axes (hv | kz, eV, theta_par | k_par)
    const Spectrum &spectrum() const {
        return _spectrum;
    }
    /// Fermi level (kinetic energy) of each photon energy
    const std::vector<double> &fermi_levels() const {
        return _fermi_levels;
    }

    /// RawHvCube -> EnergyCorrected
    void correct_energy();
    /// EnergyCorrected -> MomentumConverted
    void convert_momentum();
    /// MomentumConverted -> KzConverted
    void convert_kz();

    /**
     * @brief The current spectrum in the axis order of the input, with the
     * energy and k_par selections applied.
     */
    Spectrum result() const;

  private:
    void require_stage(Stage expected, std::string_view step) const;
    std::vector<double> estimate_fermi_levels();

    Spectrum _spectrum;
    std::vector<std::string> _input_order;
    ConversionOptions _options;
    BeamlineConvention _convention;
    ConversionWarnings &_warnings;
    Stage _stage = Stage::RawHvCube;
    std::vector<double> _fermi_levels;
    std::vector<double> _ke_delta;
    EnergySelection _energy_selection;
    double _k_perp = 0.0;
    bool _squeeze_k_par = false;
};

std::string to_string(KzConverter::Stage stage);

/**
 * @brief Run the kz conversion as far as the conversion target asks.
 *
 * convert = BE stops after the energy correction; convert = k is not
 * meaningful without kz and is treated as both, with a warning.
 */
Spectrum convert_hv_scan(const Spectrum &spectrum,
                         const ConversionOptions &options,
                         const BeamlineConvention &convention,
                         ConversionWarnings &warnings);
