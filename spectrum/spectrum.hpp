/**
 * @file spectrum.hpp
 * @brief Named-axis intensity array with ARPES metadata.
 *
 * A Spectrum owns a dense, row-major buffer of intensities together
 * with an ordered list of named coordinate axes. Axis names follow a
 * fixed vocabulary: "theta_par" (along the analyser slit), "eV" (kinetic
 * or binding energy), an optional mapping axis ("polar", "tilt",
 * "defl_perp" or "ana_polar") and an optional photon energy axis "hv".
 * Converted spectra use "k_par", "k_perp" and "kz".
 */
#pragma once

#include <array>
#include <experimental/mdspan>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "energy/energy_reference.hpp"

/// Strided view over a Spectrum buffer with the axes in a chosen order
template <typename T, size_t N>
using strided_view =
  std::experimental::mdspan<T,
                            std::experimental::dextents<size_t, N>,
                            std::experimental::layout_stride>;

struct Axis {
    std::string name;
    std::vector<double> values;

    size_t size() const {
        return values.size();
    }
    /// True when the values are strictly increasing
    bool is_increasing() const;
    /// True when the values are evenly spaced (to a small relative tolerance)
    bool is_linear() const;
    /// Spacing between the first two values (0 for a single value)
    double step() const;
    /// Index of the value nearest to x
    size_t nearest(double x) const;
};

enum class EnergyScale { Kinetic, Binding };

/**
 * @brief Manipulator, analyser and normal-emission angles in degrees.
 *
 * Any of these may instead be present as an axis of the spectrum, in
 * which case the axis takes precedence.
 */
struct ManipulatorAngles {
    std::optional<double> polar;
    std::optional<double> tilt;
    std::optional<double> azi;
    std::optional<double> norm_polar;
    std::optional<double> norm_tilt;
    std::optional<double> norm_azi;
    std::optional<double> ana_polar;
    std::optional<double> defl_par;
    std::optional<double> defl_perp;

    /// Look up an angle by name, throws std::out_of_range for unknown names
    std::optional<double> get(std::string_view name) const;
    void set(std::string_view name, double value);
    /// Replace each angle that is set in other
    void update(const ManipulatorAngles &other);

    static constexpr std::array<std::string_view, 9> names = {"polar",
                                                              "tilt",
                                                              "azi",
                                                              "norm_polar",
                                                              "norm_tilt",
                                                              "norm_azi",
                                                              "ana_polar",
                                                              "defl_par",
                                                              "defl_perp"};

  private:
    std::optional<double> *find(std::string_view name);
};

struct SpectrumMetadata {
    std::string beamline;
    EnergyScale eV_type = EnergyScale::Kinetic;
    std::optional<double> hv;
    std::optional<double> ana_slit_angle;
    ManipulatorAngles angles;
    EnergyReference EF_correction = NoReference{};
    /// Fermi level (kinetic energy) for each entry of the hv axis
    std::optional<std::vector<double>> EF_vs_hv;
    /// Detector kinetic energy offset of each hv scan relative to the first
    std::vector<double> KE_delta;
    std::optional<double> work_function;
    std::optional<double> V0;
    /// Zero-dimensional coordinates, e.g. a constant k_perp or a selected eV
    std::map<std::string, double> scalars;
    std::vector<std::string> history;
};

class Spectrum {
  public:
    Spectrum() = default;

    /**
     * @brief Construct from axes and a row-major buffer.
     * @throws std::invalid_argument if the buffer size does not match the
     * axes or axis names are repeated
     */
    Spectrum(std::vector<Axis> axes, std::vector<double> data, SpectrumMetadata metadata = {});

    /// A spectrum with every value set to fill
    static Spectrum filled(std::vector<Axis> axes, double fill, SpectrumMetadata metadata = {});

    size_t ndim() const {
        return _axes.size();
    }
    size_t size() const {
        return _data.size();
    }
    std::vector<size_t> shape() const;

    const std::vector<Axis> &axes() const {
        return _axes;
    }
    bool has_axis(std::string_view name) const {
        return axis_index(name).has_value();
    }
    std::optional<size_t> axis_index(std::string_view name) const;
    /// @throws std::out_of_range if the axis does not exist
    const Axis &axis(std::string_view name) const;
    std::vector<std::string> axis_names() const;
    const std::vector<size_t> &strides() const {
        return _strides;
    }
    size_t stride(std::string_view name) const;

    std::span<const double> data() const {
        return _data;
    }
    std::span<double> data() {
        return _data;
    }
    double min() const;
    double max() const;

    /// Element access with one index per axis, in axis order
    double &at(std::span<const size_t> index);
    double at(std::span<const size_t> index) const;

    const SpectrumMetadata &metadata() const {
        return _metadata;
    }
    SpectrumMetadata &metadata() {
        return _metadata;
    }
    void add_history(std::string entry) {
        _metadata.history.push_back(std::move(entry));
    }

    /**
     * @brief Strided view with the named axes in the requested order.
     *
     * All axes of the spectrum must be named exactly once.
     */
    template <size_t N>
    strided_view<const double, N> view(const std::array<std::string, N> &order) const {
        return strided_view<const double, N>(_data.data(), view_mapping(order));
    }
    template <size_t N>
    strided_view<double, N> view(const std::array<std::string, N> &order) {
        return strided_view<double, N>(_data.data(), view_mapping(order));
    }

  private:
    template <size_t N>
    auto view_mapping(const std::array<std::string, N> &order) const {
        if (N != ndim()) {
            throw std::invalid_argument("View order must name every axis");
        }
        std::array<size_t, N> extents;
        std::array<size_t, N> strides;
        for (size_t i = 0; i < N; ++i) {
            size_t index = axis_index_or_throw(order[i]);
            extents[i] = _axes[index].size();
            strides[i] = _strides[index];
        }
        using extents_type = std::experimental::dextents<size_t, N>;
        return std::experimental::layout_stride::mapping<extents_type>(
          extents_type(extents), strides);
    }
    size_t axis_index_or_throw(std::string_view name) const;
    void compute_strides();

    std::vector<Axis> _axes;
    std::vector<size_t> _strides;
    std::vector<double> _data;
    SpectrumMetadata _metadata;
};

/**
 * @brief Copy of a spectrum with its axes permuted into the given order.
 */
Spectrum transpose(const Spectrum &spectrum, const std::vector<std::string> &order);

/**
 * @brief Copy of a spectrum with every decreasing axis reversed.
 */
Spectrum ensure_increasing(const Spectrum &spectrum);

/**
 * @brief Remove a length-one axis, keeping its value as a scalar coordinate.
 */
Spectrum squeeze(const Spectrum &spectrum, std::string_view name);

/**
 * @brief Average over an axis, ignoring NaN, and drop it.
 *
 * The mean coordinate value is kept as a scalar coordinate.
 */
Spectrum mean_over(const Spectrum &spectrum, std::string_view name);

std::string to_string(EnergyScale scale);
EnergyScale energy_scale_from_string(const std::string &name);
