/**
 * @file sample_data.hpp
 * @brief Synthetic ARPES spectra for testing and demonstration.
 *
 * Each generator draws a free-electron-like band with a Fermi cut-off
 * and fills in the metadata a beamline loader would supply.
 */
#pragma once

#include "spectrum.hpp"

/// Evenly spaced values from start to stop inclusive
std::vector<double> linspace(double start, double stop, size_t count);

/**
 * @brief A Type I dispersion (theta_par, eV) measured with He I light.
 *
 * theta_par spans [-15, 15] degrees in 61 steps and eV spans
 * [EF - 1, EF + 0.1] with EF = 16.8 eV kinetic.
 */
Spectrum make_sample_dispersion(size_t energy_points = 111);

/**
 * @brief A Type I Fermi surface map (polar, eV, theta_par).
 */
Spectrum make_sample_map(size_t polar_points = 21, size_t energy_points = 23);

/**
 * @brief A photon energy scan (hv, eV, theta_par) from 60 to 70 eV.
 *
 * The detector window follows the Fermi level, recorded through
 * KE_delta; EF_vs_hv holds the Fermi level of each scan.
 */
Spectrum make_sample_hv_scan(size_t hv_points = 11);
