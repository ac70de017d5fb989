/**
 * @file energy_reference.hpp
 * @brief Fermi level correction descriptors and their resolution onto an
 * angular axis.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

using json = nlohmann::json;

/// No Fermi level information is available
struct NoReference {};

/// Angle independent Fermi level, in kinetic energy (eV)
struct ConstantReference {
    double fermi_level;
};

/**
 * @brief Fermi level as a polynomial in theta_par.
 *
 * EF(theta_par) = c0 + c1 theta_par + c2 theta_par^2 + c3 theta_par^3,
 * with theta_par in degrees and EF in kinetic energy (eV). At most four
 * coefficients are accepted.
 */
struct PolynomialReference {
    std::vector<double> coefficients;
};

/// Fermi level sampled at a set of theta_par values
struct SampledReference {
    std::vector<double> theta_par;
    std::vector<double> fermi_level;
};

using EnergyReference =
  std::variant<NoReference, ConstantReference, PolynomialReference, SampledReference>;

/**
 * @brief Builds an EnergyReference from its JSON description.
 *
 * Accepted forms are a plain number (constant), an object with a
 * "constant" value, an object with "coefficients" (polynomial), or an
 * object with "theta_par" and "EF" arrays (sampled). null gives
 * NoReference.
 *
 * @throws std::invalid_argument for any other shape.
 */
EnergyReference energy_reference_from_json(const json &data);
json energy_reference_to_json(const EnergyReference &reference);

/// Short human readable description used in provenance strings
std::string describe(const EnergyReference &reference);

/**
 * @brief An EnergyReference evaluated over the angular axis of a spectrum.
 *
 * Provides the absolute Fermi level as a function of theta_par, the
 * shift relative to the highest Fermi level on the axis and the derived
 * work function.
 */
class ResolvedEnergyReference {
  public:
    ResolvedEnergyReference(EnergyReference reference,
                            std::span<const double> theta_par,
                            double photon_energy);

    /// Kinetic energy of the Fermi edge at the given theta_par
    double fermi_level(double theta_par) const;

    /// Fermi level relative to the highest value on the axis (<= 0 on the axis)
    double shift(double theta_par) const {
        return fermi_level(theta_par) - _max_fermi_level;
    }

    double max_fermi_level() const {
        return _max_fermi_level;
    }
    double min_fermi_level() const {
        return _min_fermi_level;
    }
    double photon_energy() const {
        return _photon_energy;
    }
    /// hv - max(EF): aligns the highest Fermi edge with zero binding energy
    double work_function() const {
        return _photon_energy - _max_fermi_level;
    }
    const EnergyReference &reference() const {
        return _reference;
    }

    /// History text describing the correction that was applied
    std::string history() const;

  private:
    EnergyReference _reference;
    double _photon_energy;
    double _max_fermi_level;
    double _min_fermi_level;
};

/**
 * @brief Resolve a Fermi level correction onto a theta_par axis.
 *
 * @param reference The correction descriptor
 * @param theta_par The angular axis the correction will be evaluated on
 * @param photon_energy Photon energy, if known
 * @throws MissingReferenceError if the reference is NoReference or the
 * photon energy is absent
 * @throws ConfigurationError if the descriptor is malformed
 */
ResolvedEnergyReference resolve_energy_reference(const EnergyReference &reference,
                                                 std::span<const double> theta_par,
                                                 std::optional<double> photon_energy);

/**
 * @brief Linear interpolation with linear extrapolation beyond the ends.
 *
 * @param x Sample positions, strictly increasing
 * @param y Sample values
 * @param at Position to evaluate
 */
double interpolate_extrapolate(std::span<const double> x,
                               std::span<const double> y,
                               double at);
