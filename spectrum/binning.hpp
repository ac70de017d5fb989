/**
 * @file binning.hpp
 * @brief Block-mean binning of spectra along named axes.
 */
#ifndef BINNING_HPP
#define BINNING_HPP

#include <map>
#include <string>

#include "spectrum.hpp"

/**
 * @brief Integer block factor per axis name.
 *
 * Axes that are not named are left untouched.
 */
struct BinningSpec {
    std::map<std::string, int> factors;

    bool is_identity() const;
    std::string describe() const;
};

/**
 * @brief Average consecutive blocks of samples along each binned axis.
 *
 * A trailing block shorter than the factor is padded: its mean is taken
 * over the samples it has, so an axis of length n becomes
 * ceil(n / factor). NaN samples are skipped when averaging. Coordinates
 * are averaged the same way.
 *
 * @throws ConfigurationError if an axis is unknown or a factor is below 1
 */
Spectrum bin(const Spectrum &spectrum, const BinningSpec &spec);

#endif  // BINNING_HPP
