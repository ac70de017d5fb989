/**
 * @file spectrum.cc
 * @brief Named-axis intensity array implementation.
 */
#include "spectrum.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <set>

bool Axis::is_increasing() const {
    for (size_t i = 1; i < values.size(); ++i) {
        if (!(values[i] > values[i - 1])) {
            return false;
        }
    }
    return true;
}

bool Axis::is_linear() const {
    if (values.size() < 3) {
        return true;
    }
    double expected = (values.back() - values.front()) / (values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) {
        if (std::abs((values[i] - values[i - 1]) - expected)
            > 1e-6 * std::abs(expected)) {
            return false;
        }
    }
    return true;
}

double Axis::step() const {
    return values.size() < 2 ? 0.0 : values[1] - values[0];
}

size_t Axis::nearest(double x) const {
    if (values.empty()) {
        throw std::out_of_range(fmt::format("Axis '{}' is empty", name));
    }
    auto closest = std::min_element(values.begin(), values.end(), [x](double a, double b) {
        return std::abs(a - x) < std::abs(b - x);
    });
    return std::distance(values.begin(), closest);
}

std::optional<double> *ManipulatorAngles::find(std::string_view name) {
    if (name == "polar") return &polar;
    if (name == "tilt") return &tilt;
    if (name == "azi") return &azi;
    if (name == "norm_polar") return &norm_polar;
    if (name == "norm_tilt") return &norm_tilt;
    if (name == "norm_azi") return &norm_azi;
    if (name == "ana_polar") return &ana_polar;
    if (name == "defl_par") return &defl_par;
    if (name == "defl_perp") return &defl_perp;
    throw std::out_of_range(fmt::format("Unknown manipulator angle '{}'", name));
}

std::optional<double> ManipulatorAngles::get(std::string_view name) const {
    return *const_cast<ManipulatorAngles *>(this)->find(name);
}

void ManipulatorAngles::set(std::string_view name, double value) {
    *find(name) = value;
}

void ManipulatorAngles::update(const ManipulatorAngles &other) {
    for (auto name : names) {
        if (auto value = other.get(name)) {
            set(name, *value);
        }
    }
}

Spectrum::Spectrum(std::vector<Axis> axes, std::vector<double> data, SpectrumMetadata metadata)
    : _axes(std::move(axes)), _data(std::move(data)), _metadata(std::move(metadata)) {
    std::set<std::string> names;
    for (auto &axis : _axes) {
        if (!names.insert(axis.name).second) {
            throw std::invalid_argument(
              fmt::format("Axis '{}' appears more than once", axis.name));
        }
        if (axis.values.empty()) {
            throw std::invalid_argument(fmt::format("Axis '{}' is empty", axis.name));
        }
    }
    compute_strides();
    auto expected = std::transform_reduce(
      _axes.begin(), _axes.end(), size_t{1}, std::multiplies<>(), [](const Axis &a) {
          return a.size();
      });
    if (expected != _data.size()) {
        throw std::invalid_argument(fmt::format(
          "Data has {} values but the axes describe {}", _data.size(), expected));
    }
}

Spectrum Spectrum::filled(std::vector<Axis> axes, double fill, SpectrumMetadata metadata) {
    size_t count = 1;
    for (auto &axis : axes) {
        count *= axis.size();
    }
    return Spectrum(std::move(axes), std::vector<double>(count, fill), std::move(metadata));
}

void Spectrum::compute_strides() {
    _strides.assign(_axes.size(), 1);
    for (size_t i = _axes.size(); i-- > 1;) {
        _strides[i - 1] = _strides[i] * _axes[i].size();
    }
}

std::vector<size_t> Spectrum::shape() const {
    std::vector<size_t> result;
    for (auto &axis : _axes) {
        result.push_back(axis.size());
    }
    return result;
}

std::optional<size_t> Spectrum::axis_index(std::string_view name) const {
    for (size_t i = 0; i < _axes.size(); ++i) {
        if (_axes[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

size_t Spectrum::axis_index_or_throw(std::string_view name) const {
    auto index = axis_index(name);
    if (!index) {
        throw std::out_of_range(fmt::format("Spectrum has no axis '{}'", name));
    }
    return *index;
}

const Axis &Spectrum::axis(std::string_view name) const {
    return _axes[axis_index_or_throw(name)];
}

size_t Spectrum::stride(std::string_view name) const {
    return _strides[axis_index_or_throw(name)];
}

std::vector<std::string> Spectrum::axis_names() const {
    std::vector<std::string> names;
    for (auto &axis : _axes) {
        names.push_back(axis.name);
    }
    return names;
}

double Spectrum::min() const {
    double result = std::numeric_limits<double>::quiet_NaN();
    for (double v : _data) {
        if (!std::isnan(v) && !(result <= v)) {
            result = v;
        }
    }
    return result;
}

double Spectrum::max() const {
    double result = std::numeric_limits<double>::quiet_NaN();
    for (double v : _data) {
        if (!std::isnan(v) && !(result >= v)) {
            result = v;
        }
    }
    return result;
}

double &Spectrum::at(std::span<const size_t> index) {
    size_t offset = 0;
    for (size_t i = 0; i < index.size(); ++i) {
        offset += index[i] * _strides[i];
    }
    return _data[offset];
}

double Spectrum::at(std::span<const size_t> index) const {
    return const_cast<Spectrum *>(this)->at(index);
}

Spectrum transpose(const Spectrum &spectrum, const std::vector<std::string> &order) {
    if (order.size() != spectrum.ndim()) {
        throw std::invalid_argument("Transpose order must name every axis");
    }
    std::vector<Axis> axes;
    std::vector<size_t> source_strides;
    for (auto &name : order) {
        axes.push_back(spectrum.axis(name));
        source_strides.push_back(spectrum.stride(name));
    }
    if (axes.empty() || spectrum.axis_names() == order) {
        return spectrum;
    }

    std::vector<double> data(spectrum.size());
    std::vector<size_t> index(axes.size(), 0);
    auto source = spectrum.data();
    for (size_t flat = 0; flat < data.size(); ++flat) {
        size_t offset = 0;
        for (size_t d = 0; d < axes.size(); ++d) {
            offset += index[d] * source_strides[d];
        }
        data[flat] = source[offset];
        // Advance the output multi-index, last axis fastest
        for (size_t d = axes.size(); d-- > 0;) {
            if (++index[d] < axes[d].size()) break;
            index[d] = 0;
        }
    }
    return Spectrum(std::move(axes), std::move(data), spectrum.metadata());
}

Spectrum ensure_increasing(const Spectrum &spectrum) {
    Spectrum result = spectrum;
    for (size_t d = 0; d < result.ndim(); ++d) {
        const auto &values = result.axes()[d].values;
        if (values.size() < 2) {
            continue;
        }
        bool increasing = values.front() < values.back();
        auto out_of_order = increasing ? std::adjacent_find(values.begin(),
                                                            values.end(),
                                                            std::greater_equal<double>())
                                       : std::adjacent_find(values.begin(),
                                                            values.end(),
                                                            std::less_equal<double>());
        if (out_of_order != values.end()) {
            throw std::invalid_argument(
              fmt::format("Axis '{}' is not strictly monotonic at {}",
                          result.axes()[d].name,
                          *out_of_order));
        }
        if (increasing) {
            continue;
        }
        std::vector<Axis> axes = result.axes();
        std::reverse(axes[d].values.begin(), axes[d].values.end());

        size_t n = axes[d].size();
        size_t stride = result.strides()[d];
        auto source = result.data();
        std::vector<double> data(source.size());
        for (size_t flat = 0; flat < source.size(); ++flat) {
            size_t i = (flat / stride) % n;
            data[flat + (n - 1 - 2 * i) * stride] = source[flat];
        }
        result = Spectrum(std::move(axes), std::move(data), result.metadata());
    }
    return result;
}

Spectrum squeeze(const Spectrum &spectrum, std::string_view name) {
    const Axis &axis = spectrum.axis(name);
    if (axis.size() != 1) {
        throw std::invalid_argument(
          fmt::format("Cannot squeeze axis '{}' of length {}", name, axis.size()));
    }
    std::vector<Axis> axes;
    for (auto &a : spectrum.axes()) {
        if (a.name != name) axes.push_back(a);
    }
    SpectrumMetadata metadata = spectrum.metadata();
    metadata.scalars[std::string(name)] = axis.values[0];
    std::vector<double> data(spectrum.data().begin(), spectrum.data().end());
    return Spectrum(std::move(axes), std::move(data), std::move(metadata));
}

Spectrum mean_over(const Spectrum &spectrum, std::string_view name) {
    size_t d = *spectrum.axis_index(name);
    const Axis &axis = spectrum.axes()[d];
    size_t n = axis.size();
    size_t stride = spectrum.strides()[d];

    std::vector<Axis> axes;
    for (auto &a : spectrum.axes()) {
        if (a.name != name) axes.push_back(a);
    }
    size_t outer = spectrum.size() / (n * stride);
    std::vector<double> data(outer * stride);
    auto source = spectrum.data();
    for (size_t o = 0; o < outer; ++o) {
        for (size_t s = 0; s < stride; ++s) {
            double total = 0.0;
            size_t count = 0;
            for (size_t i = 0; i < n; ++i) {
                double v = source[(o * n + i) * stride + s];
                if (!std::isnan(v)) {
                    total += v;
                    ++count;
                }
            }
            data[o * stride + s] =
              count ? total / count : std::numeric_limits<double>::quiet_NaN();
        }
    }
    SpectrumMetadata metadata = spectrum.metadata();
    metadata.scalars[std::string(name)] =
      std::accumulate(axis.values.begin(), axis.values.end(), 0.0) / n;
    return Spectrum(std::move(axes), std::move(data), std::move(metadata));
}

std::string to_string(EnergyScale scale) {
    return scale == EnergyScale::Binding ? "binding" : "kinetic";
}

EnergyScale energy_scale_from_string(const std::string &name) {
    if (name == "binding") return EnergyScale::Binding;
    if (name == "kinetic") return EnergyScale::Kinetic;
    throw std::invalid_argument(fmt::format("Unknown eV_type '{}'", name));
}
