/**
 * @file conversion_options.hpp
 * @brief Call-time options of a conversion.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "energy/energy_reference.hpp"
#include "spectrum/binning.hpp"
#include "spectrum/spectrum.hpp"

using json = nlohmann::json;

/**
 * @brief Struct to store the conversion target and its string representation.
 */
struct ConversionTarget {
    enum class Target { Momentum, BindingEnergy, Both, MomentumTransfer };
    Target target = Target::Both;

    ConversionTarget() = default;
    ConversionTarget(Target target) : target(target) {}

    /**
     * @brief Parse "k", "BE", "both" or "q" (case-insensitive).
     * @throws std::invalid_argument if the name is not recognised.
     */
    explicit ConversionTarget(std::string input);

    bool momentum() const {
        return target == Target::Momentum || target == Target::Both;
    }
    bool binding_energy() const {
        return target == Target::BindingEnergy || target == Target::Both;
    }
    std::string to_string() const;
};

/// Half-open description of a coordinate window with an optional step
struct CoordinateWindow {
    double start;
    double stop;
    std::optional<double> step;
};

/// Either a single coordinate value (nearest sample) or a window
struct CoordinateSelector {
    std::optional<double> value;
    std::optional<CoordinateWindow> window;

    static CoordinateSelector at(double value) {
        return {value, std::nullopt};
    }
    static CoordinateSelector between(double start,
                                      double stop,
                                      std::optional<double> step = std::nullopt) {
        return {std::nullopt, CoordinateWindow{start, stop, step}};
    }
};

/**
 * Constant energy map: mean over width around centre. Without a centre the
 * map sits at the Fermi level, which is 0 on a binding energy axis.
 */
struct FermiSurfaceSelector {
    double width = 0.0;
    std::optional<double> centre;
};

struct ConversionOptions {
    ConversionTarget convert;
    /// Momentum spacing, inverse angstrom
    std::optional<double> dk;
    /// kz spacing, inverse angstrom
    std::optional<double> dkz;
    std::optional<BinningSpec> binning;
    /// Uniform factor over eV and theta_par; 1 disables all binning
    std::optional<int> bin_factor;
    std::optional<CoordinateSelector> eV;
    std::optional<FermiSurfaceSelector> FS;
    /// Momentum along the slit to keep, clipped to the converted range
    std::optional<CoordinateSelector> k_par;
    /// Momentum across the slit to keep, maps only
    std::optional<CoordinateSelector> k_perp;
    /// Inner potential, eV
    std::optional<double> V0;
    std::optional<double> hv;
    std::optional<EnergyReference> EF_correction;
    ManipulatorAngles angles;

    /**
     * @brief Check the options for mutually exclusive combinations.
     *
     * @throws ConflictingBinningError if binning and bin_factor are both set
     * @throws ConflictingOptionsError if eV and FS are both set
     * @throws ConfigurationError for non-positive spacings or bin factors
     */
    void validate() const;

    /**
     * @brief Load options from JSON. Every key is optional.
     * @throws std::invalid_argument for malformed values
     */
    static ConversionOptions from_json(const json &data);
};

/// Default inner potential, eV
constexpr double DEFAULT_INNER_POTENTIAL = 12.0;
