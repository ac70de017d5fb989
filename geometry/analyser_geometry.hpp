/**
 * @file analyser_geometry.hpp
 * @brief Analyser type detection and assembly of the angles entering the
 * momentum conversion.
 *
 * Angle names follow Ishida & Shin: alpha is the angle along the slit,
 * beta the angle perpendicular to it, delta the azimuth, xi the
 * manipulator rotation about the slit and chi the additional rotation
 * used by deflector analysers. All angles are in degrees.
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "beamline_convention.hpp"
#include "conversion_warnings.hpp"
#include "spectrum/spectrum.hpp"

/**
 * @brief Struct to store the analyser type and its string representation.
 *
 * Type I has a vertical slit (slit angle 90), Type II a horizontal one
 * (slit angle 0). The primed variants use deflectors for the
 * perpendicular angle.
 */
struct AnalyserType {
    enum class Type { I, II, Ip, IIp };
    Type type;

    AnalyserType(Type type) : type(type) {}

    /**
     * @brief Parse the names "I", "II", "Ip", "IIp" (primes accepted).
     * @throws std::invalid_argument if the name is not recognised.
     */
    explicit AnalyserType(std::string input);

    bool has_deflector() const {
        return type == Type::Ip || type == Type::IIp;
    }
    /// True when the slit runs along kx (Type I family)
    bool slit_along_kx() const {
        return type == Type::I || type == Type::Ip;
    }
    std::string to_string() const;

    bool operator==(const AnalyserType &other) const = default;
};

/**
 * @brief Linear map from a recorded axis coordinate to a geometry angle.
 *
 * angle = coordinate * sign + offset
 */
struct AngleMap {
    double sign = 1;
    double offset = 0;

    double to_angle(double coordinate) const {
        return coordinate * sign + offset;
    }
    double to_coordinate(double angle) const {
        return (angle - offset) / sign;
    }
};

/**
 * @brief Resolved analyser geometry for one spectrum.
 *
 * alpha is always driven by the theta_par axis. beta is either a
 * constant or driven by the mapping axis. delta, xi and chi are
 * constants; the normal-emission offsets beta_0, xi_0 and chi_0 are
 * subtracted inside the mapping functions.
 */
struct AnalyserGeometry {
    AnalyserType type = AnalyserType::Type::I;
    double delta = 0;
    double xi = 0;
    double xi_0 = 0;
    double beta_0 = 0;
    double chi = 0;
    double chi_0 = 0;

    AngleMap alpha_map;
    /// Name of the scanned axis driving beta, if any
    std::optional<std::string> mapping_axis;
    AngleMap beta_map;
    /// beta when no mapping axis is scanned
    double beta = 0;

    /// alpha evaluated on the spectrum's theta_par axis
    std::vector<double> alpha_values;
    /// beta evaluated on the mapping axis, or the single constant value
    std::vector<double> beta_values;

    /// Normal-emission angles as recorded, for the provenance string
    double norm_polar = 0;
    double norm_tilt = 0;
    double norm_azi = 0;

    std::string describe() const;
};

/// Mapping axis names the conversion can handle
inline constexpr std::array<std::string_view, 4> supported_mapping_axes = {
  "polar", "tilt", "defl_perp", "ana_polar"};

/**
 * @brief Determine the analyser type and assemble the conversion angles.
 *
 * Angles are taken from the spectrum axes where present, then from the
 * overrides, then from the metadata.
 *
 * @param spectrum Spectrum with a theta_par axis and optionally one
 * mapping axis
 * @param convention Sign conventions of the beamline
 * @param overrides User supplied angles replacing the metadata values
 * @param warnings Receives a message for every defaulted normal-emission angle
 * @throws ConfigurationError if the slit orientation or a required angle
 * is missing
 * @throws UnsupportedGeometryError if the mapping axis cannot drive beta
 */
AnalyserGeometry resolve_geometry(const Spectrum &spectrum,
                                  const BeamlineConvention &convention,
                                  const ManipulatorAngles &overrides,
                                  ConversionWarnings &warnings);

/// Name of the (at most one) mapping axis of a spectrum, if any
std::optional<std::string> find_mapping_axis(const Spectrum &spectrum);
