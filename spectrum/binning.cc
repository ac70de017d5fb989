/**
 * @file binning.cc
 * @brief Block-mean binning implementation.
 */
#include "binning.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <cmath>
#include <limits>
#include <vector>

#include "kconv_errors.hpp"
#include "kconv_logger.hpp"

namespace {

/// Block means along one axis, with a padded trailing block
Spectrum bin_axis(const Spectrum &spectrum, size_t d, size_t factor) {
    const Axis &axis = spectrum.axes()[d];
    size_t n = axis.size();
    size_t n_out = (n + factor - 1) / factor;
    size_t stride = spectrum.strides()[d];
    size_t outer = spectrum.size() / (n * stride);

    std::vector<Axis> axes = spectrum.axes();
    std::vector<double> coords(n_out);
    for (size_t b = 0; b < n_out; ++b) {
        size_t end = std::min(n, (b + 1) * factor);
        double total = 0.0;
        for (size_t i = b * factor; i < end; ++i) {
            total += axis.values[i];
        }
        coords[b] = total / (end - b * factor);
    }
    axes[d].values = std::move(coords);

    std::vector<double> data(outer * n_out * stride);
    auto source = spectrum.data();
    for (size_t o = 0; o < outer; ++o) {
        for (size_t b = 0; b < n_out; ++b) {
            size_t end = std::min(n, (b + 1) * factor);
            for (size_t s = 0; s < stride; ++s) {
                double total = 0.0;
                size_t count = 0;
                for (size_t i = b * factor; i < end; ++i) {
                    double v = source[(o * n + i) * stride + s];
                    if (!std::isnan(v)) {
                        total += v;
                        ++count;
                    }
                }
                data[(o * n_out + b) * stride + s] =
                  count ? total / count : std::numeric_limits<double>::quiet_NaN();
            }
        }
    }
    return Spectrum(std::move(axes), std::move(data), spectrum.metadata());
}

}  // namespace

bool BinningSpec::is_identity() const {
    for (auto &[name, factor] : factors) {
        if (factor != 1) return false;
    }
    return true;
}

std::string BinningSpec::describe() const {
    return fmt::format("{}", factors);
}

Spectrum bin(const Spectrum &spectrum, const BinningSpec &spec) {
    Spectrum result = spectrum;
    for (auto &[name, factor] : spec.factors) {
        auto d = spectrum.axis_index(name);
        if (!d) {
            throw ConfigurationError(
              fmt::format("Cannot bin along '{}': the spectrum has no such axis", name));
        }
        if (factor < 1) {
            throw ConfigurationError(
              fmt::format("Bin factor for '{}' must be at least 1, got {}", name, factor));
        }
        if (factor == 1) continue;
        result = bin_axis(result, *d, static_cast<size_t>(factor));
    }
    if (!spec.is_identity()) {
        logger.debug("Binned spectrum by {}", spec.describe());
        result.add_history(fmt::format("Binned by {}", spec.describe()));
    }
    return result;
}
