/**
 * @file fermi_estimate.hpp
 * @brief Automatic estimates of the Fermi level and photon energy, used
 * when a spectrum arrives without a calibration.
 */
#pragma once

#include <optional>
#include <span>
#include <vector>

/**
 * @brief Estimate the Fermi level from an energy distribution curve.
 *
 * The curve is Gaussian smoothed, differentiated and smoothed again. The
 * Fermi level is the highest-energy peak of -dI/dE whose prominence
 * exceeds 2.5 times the noise of the derivative; when no peak qualifies
 * the global maximum of -dI/dE is used. The result is rounded to 1 meV.
 *
 * @param energy Increasing energy axis (eV)
 * @param intensity Intensity at each energy; NaN samples are treated as 0
 * @return nullopt when fewer than 5 samples are given
 */
std::optional<double> estimate_fermi_level(std::span<const double> energy,
                                           std::span<const double> intensity);

/**
 * @brief Guess the photon energy from a kinetic-energy Fermi level.
 *
 * Recognises a He I lamp and the common laser sources; otherwise assumes
 * a 4.4 eV work function.
 */
double estimate_photon_energy(double fermi_level);

/// Work function assumed when nothing better is known, eV
constexpr double DEFAULT_WORK_FUNCTION = 4.4;

/**
 * @brief Least-squares polynomial fit.
 *
 * @return Coefficients c0..c_degree of c0 + c1 x + ...
 */
std::vector<double> fit_polynomial(std::span<const double> x,
                                   std::span<const double> y,
                                   int degree);

double evaluate_polynomial(std::span<const double> coefficients, double x);

/// Gaussian filter with reflected edges, sigma in samples
std::vector<double> gaussian_smooth(std::span<const double> values, double sigma);
