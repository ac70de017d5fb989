/**
 * @file interpolation.hpp
 * @brief Multilinear interpolation of a Spectrum on its rectilinear grid.
 *
 * Points outside the sampled range of any axis evaluate to NaN; there
 * is no extrapolation. NaN samples only propagate into the result when
 * they carry a non-zero weight.
 */
#pragma once

#include <array>
#include <cmath>
#include <limits>
#include <span>
#include <string>
#include <vector>

#include "spectrum/spectrum.hpp"

/**
 * @brief Locates a coordinate within an increasing axis.
 *
 * Evenly spaced axes are located arithmetically, others by binary
 * search.
 */
class AxisLocator {
  public:
    explicit AxisLocator(const Axis &axis);

    /**
     * @brief Find the cell containing x.
     *
     * @param x Coordinate to locate
     * @param index Set to the lower sample of the cell
     * @param fraction Set to the position of x within the cell, in [0, 1].
     * Positions within 1e-12 of either end are reported as exactly 0 or 1.
     * @return false if x lies outside the axis range
     */
    bool locate(double x, size_t &index, double &fraction) const;

  private:
    std::vector<double> _values;
    bool _linear;
    double _start;
    double _step;
};

/**
 * @brief Multilinear interpolator over N named axes of a spectrum.
 *
 * The order given at construction fixes the order of the coordinates
 * passed to operator(). Every axis of the spectrum must be named.
 */
template <size_t N>
class GridInterpolator {
  public:
    GridInterpolator(const Spectrum &spectrum, const std::array<std::string, N> &order)
        : _view(spectrum.view(order)) {
        for (size_t d = 0; d < N; ++d) {
            _locators.emplace_back(spectrum.axis(order[d]));
        }
    }

    double operator()(const std::array<double, N> &point) const {
        std::array<size_t, N> base;
        std::array<double, N> fraction;
        for (size_t d = 0; d < N; ++d) {
            if (!_locators[d].locate(point[d], base[d], fraction[d])) {
                return std::numeric_limits<double>::quiet_NaN();
            }
        }
        double value = 0.0;
        // Sum over the 2^N corners of the enclosing cell
        for (size_t corner = 0; corner < (size_t{1} << N); ++corner) {
            double weight = 1.0;
            size_t offset = 0;
            for (size_t d = 0; d < N; ++d) {
                bool upper = (corner >> d) & 1;
                weight *= upper ? fraction[d] : 1.0 - fraction[d];
                offset += (base[d] + (upper ? 1 : 0)) * _view.stride(d);
            }
            if (weight == 0.0) {
                continue;
            }
            value += weight * _view.data_handle()[offset];
        }
        return value;
    }

  private:
    strided_view<const double, N> _view;
    std::vector<AxisLocator> _locators;
};
