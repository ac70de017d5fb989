/**
 * @file grid_bounds.cc
 * @brief Momentum grid extent estimation.
 */
#include "grid_bounds.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "kconv_errors.hpp"
#include "kconv_logger.hpp"

GridBounds estimate_grid_bounds(const MomentumMapper &mapper,
                                std::span<const double> alpha,
                                std::span<const double> beta,
                                double Ek_min,
                                double Ek_max) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    GridBounds bounds{{inf, -inf}, {inf, -inf}, 0.0, 0.0};

    double perp_sum = 0.0;
    double perp_sum_sq = 0.0;
    size_t count = 0;
    const std::array<double, 2> energies = {Ek_min, Ek_max};
    for (double a : alpha) {
        for (double b : beta) {
            for (double Ek : energies) {
                KVector k = mapper.forward(a, b, Ek);
                double k_par = mapper.along_slit(k);
                double k_perp = mapper.across_slit(k);
                if (std::isnan(k_par) || std::isnan(k_perp)) continue;
                bounds.k_par.min = std::min(bounds.k_par.min, k_par);
                bounds.k_par.max = std::max(bounds.k_par.max, k_par);
                bounds.k_perp.min = std::min(bounds.k_perp.min, k_perp);
                bounds.k_perp.max = std::max(bounds.k_perp.max, k_perp);
                perp_sum += k_perp;
                perp_sum_sq += k_perp * k_perp;
                ++count;
            }
        }
    }
    if (count == 0) {
        throw ConfigurationError(
          fmt::format("No sampled angle maps to a real momentum between {} and {} eV",
                      Ek_min,
                      Ek_max));
    }
    bounds.k_perp_mean = perp_sum / count;
    bounds.k_perp_spread =
      std::sqrt(std::max(0.0, perp_sum_sq / count - bounds.k_perp_mean * bounds.k_perp_mean));

    logger.debug("Momentum bounds: k_par [{:.4f}, {:.4f}], k_perp [{:.4f}, {:.4f}]",
                 bounds.k_par.min,
                 bounds.k_par.max,
                 bounds.k_perp.min,
                 bounds.k_perp.max);
    return bounds;
}

std::vector<double> make_axis(double start, double stop, double step) {
    if (!(step > 0)) {
        throw ConfigurationError(fmt::format("Axis step must be positive, got {}", step));
    }
    if (!(stop >= start)) {
        throw ConfigurationError(
          fmt::format("Axis range [{}, {}] is empty", start, stop));
    }
    // Tolerate rounding so that an exact multiple does not add a point
    size_t n = static_cast<size_t>(std::ceil((stop - start) / step - 1e-9)) + 1;
    std::vector<double> values(n);
    for (size_t i = 0; i < n; ++i) {
        values[i] = start + i * step;
    }
    return values;
}

std::vector<double> select_momentum_axis(std::string_view name,
                                         const MomentumRange &range,
                                         double dk,
                                         const std::optional<CoordinateSelector> &selection) {
    if (!selection) {
        return make_axis(range.min, range.max, dk);
    }
    if (selection->value) {
        if (!range.contains(*selection->value)) {
            throw ConflictingOptionsError(
              fmt::format("{} = {} lies outside the converted range [{:.4f}, {:.4f}]",
                          name,
                          *selection->value,
                          range.min,
                          range.max));
        }
        return {*selection->value};
    }
    const auto &window = *selection->window;
    double lowest = std::max(window.start, range.min);
    double highest = std::min(window.stop, range.max);
    if (!(highest >= lowest)) {
        throw ConflictingOptionsError(
          fmt::format("{} window [{}, {}] does not overlap the converted range [{:.4f}, {:.4f}]",
                      name,
                      window.start,
                      window.stop,
                      range.min,
                      range.max));
    }
    if (lowest > window.start || highest < window.stop) {
        logger.debug("Clipped {} window to [{:.4f}, {:.4f}]", name, lowest, highest);
    }
    return make_axis(lowest, highest, window.step.value_or(dk));
}

double matching_step(const MomentumRange &range, size_t source_points) {
    if (source_points < 2 || range.max <= range.min) {
        return DEFAULT_MAP_DK;
    }
    return (range.max - range.min) / (source_points - 1);
}
