/**
 * @file momentum_mapping.hpp
 * @brief Forward (angle to k) and inverse (k to angle) maps for the four
 * analyser types.
 *
 * All angles are in degrees, energies are kinetic energies in eV and
 * momenta are in inverse angstrom. Inputs outside the photoemission
 * horizon (|k| > k_vac) give NaN rather than an error, so that the
 * resampler can leave those cells empty.
 *
 * Reference: Y. Ishida and S. Shin, Rev. Sci. Instrum. 89, 043903 (2018)
 */
#pragma once

#include <Eigen/Dense>
#include <cmath>

#include "analyser_geometry.hpp"

/// sqrt(2 m_e) / hbar, in inverse angstrom per sqrt(eV)
constexpr double KVAC_CONST = 0.5123167222813994;

struct KVector {
    double kx;
    double ky;
};

struct AnglePair {
    double alpha;
    double beta;
};

/// Sine and cosine of the fixed rotation angles (degrees in, radians inside)
struct RotationAngles {
    double sd, cd;  // azimuth
    double sx, cx;  // tilt
    double sc, cc;  // polar (deflector types)

    RotationAngles(double delta, double xi, double chi = 0.0);
};

/// Momentum of a free electron in vacuum with the given kinetic energy
inline double k_vacuum(double kinetic_energy) {
    return KVAC_CONST * std::sqrt(kinetic_energy);
}

/**
 * @brief Inverse of the sample rotation used by deflector analysers.
 *
 * Built from the azimuth (delta), tilt (xi) and polar (chi) rotations;
 * the rows give the components of a laboratory k vector along the
 * analyser frame.
 */
Eigen::Matrix3d deflector_rotation_inverse(double delta, double xi, double chi);

// Forward maps. beta, xi and chi are relative to normal emission.
KVector forward_type_i(double alpha, double beta, double delta, double xi, double Ek);
KVector forward_type_ii(double alpha, double beta, double delta, double xi, double Ek);
KVector forward_type_ip(double alpha,
                        double beta,
                        double delta,
                        double xi,
                        double chi,
                        double Ek);
KVector forward_type_iip(double alpha,
                         double beta,
                         double delta,
                         double xi,
                         double chi,
                         double Ek);

// Inverse maps. The returned beta includes beta_0.
AnglePair inverse_type_i(double kx,
                         double ky,
                         double delta,
                         double xi,
                         double beta_0,
                         double Ek);
AnglePair inverse_type_ii(double kx,
                          double ky,
                          double delta,
                          double xi,
                          double beta_0,
                          double Ek);
AnglePair inverse_type_ip(double kx,
                          double ky,
                          double delta,
                          double xi,
                          double chi,
                          double Ek);
AnglePair inverse_type_iip(double kx,
                           double ky,
                           double delta,
                           double xi,
                           double chi,
                           double Ek);

/**
 * @brief Forward and inverse maps bound to one resolved geometry.
 *
 * Precomputes the trigonometry of the fixed angles so that the resampler
 * can call the inverse once per output cell.
 */
class MomentumMapper {
  public:
    explicit MomentumMapper(const AnalyserGeometry &geometry);

    /// alpha and beta are absolute geometry angles (beta including beta_0)
    KVector forward(double alpha, double beta, double Ek) const;
    AnglePair inverse(double kx, double ky, double Ek) const;

    /// Component of k along the analyser slit
    double along_slit(const KVector &k) const {
        return _geometry.type.slit_along_kx() ? k.kx : k.ky;
    }
    /// In-plane component of k perpendicular to the slit
    double across_slit(const KVector &k) const {
        return _geometry.type.slit_along_kx() ? k.ky : k.kx;
    }
    KVector from_slit_components(double k_par, double k_perp) const {
        return _geometry.type.slit_along_kx() ? KVector{k_par, k_perp}
                                              : KVector{k_perp, k_par};
    }

    const AnalyserGeometry &geometry() const {
        return _geometry;
    }

  private:
    AnalyserGeometry _geometry;
    RotationAngles _fixed;
    Eigen::Matrix3d _rotation_inverse;
};
