/**
 * @file grid_bounds.hpp
 * @brief Extent of the momentum grid covered by a set of emission angles.
 */
#pragma once

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "conversion_options.hpp"
#include "geometry/momentum_mapping.hpp"

/// Range of one momentum component
struct MomentumRange {
    double min;
    double max;

    bool contains(double k) const {
        return k >= min && k <= max;
    }
};

/**
 * @brief Momentum extents of the sampled angles, split into the
 * components along and across the analyser slit.
 */
struct GridBounds {
    MomentumRange k_par;
    MomentumRange k_perp;
    /// Mean and standard deviation of k_perp over the evaluated samples
    double k_perp_mean;
    double k_perp_spread;
};

/**
 * @brief Evaluate the forward map over the sampled angles to bound the
 * momentum grid.
 *
 * Every (alpha, beta) sample is mapped at the lowest and highest kinetic
 * energy. Since |k| scales with sqrt(Ek), each momentum component is
 * extremal at one of the two energies, so the bounds contain the image
 * of every sampled (alpha, beta, Ek) point.
 *
 * @param mapper Forward map for the resolved geometry
 * @param alpha Sampled alpha values (degrees)
 * @param beta Sampled beta values (degrees), a single value for dispersions
 * @param Ek_min Lowest kinetic energy present
 * @param Ek_max Highest kinetic energy present
 */
GridBounds estimate_grid_bounds(const MomentumMapper &mapper,
                                std::span<const double> alpha,
                                std::span<const double> beta,
                                double Ek_min,
                                double Ek_max);

/**
 * @brief Build an evenly spaced axis from start in steps of step until
 * stop is covered.
 *
 * @throws ConfigurationError if step is not positive or the range is empty
 */
std::vector<double> make_axis(double start, double stop, double step);

/**
 * @brief Momentum axis covering a range, restricted by an optional selection.
 *
 * Without a selection the whole range is sampled with dk. A value selects
 * that single momentum; a window is clipped to the range and sampled with
 * its own step, or dk when it has none.
 *
 * @param name Axis name used in error messages
 * @throws ConflictingOptionsError if the selection does not overlap the range
 */
std::vector<double> select_momentum_axis(std::string_view name,
                                         const MomentumRange &range,
                                         double dk,
                                         const std::optional<CoordinateSelector> &selection);

/// Spacing giving the same number of points as the source axis
double matching_step(const MomentumRange &range, size_t source_points);

/// Spread above which a dispersion is not treated as a constant k_perp cut
constexpr double K_PERP_SPREAD_THRESHOLD = 0.01;

/// Default momentum spacing for maps, inverse angstrom
constexpr double DEFAULT_MAP_DK = 0.01;
