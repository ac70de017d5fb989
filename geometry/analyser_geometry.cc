/**
 * @file analyser_geometry.cc
 * @brief Analyser type detection and angle assembly.
 */
#include "analyser_geometry.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "kconv_errors.hpp"

AnalyserType::AnalyserType(std::string input) {
    std::string name = input;
    // Accept both Ip and I' spellings
    std::replace(name.begin(), name.end(), '\'', 'p');
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    if (name == "i") {
        type = Type::I;
    } else if (name == "ii") {
        type = Type::II;
    } else if (name == "ip") {
        type = Type::Ip;
    } else if (name == "iip") {
        type = Type::IIp;
    } else {
        throw std::invalid_argument("Invalid analyser type " + input);
    }
}

std::string AnalyserType::to_string() const {
    switch (type) {
    case Type::I:
        return "I";
    case Type::II:
        return "II";
    case Type::Ip:
        return "Ip";
    case Type::IIp:
        return "IIp";
    }
    return "unknown";
}

std::string AnalyserGeometry::describe() const {
    std::string text = fmt::format(
      "analyser type {}, normal emission (polar {}, tilt {}, azi {}), delta {}, xi {}",
      type.to_string(),
      norm_polar,
      norm_tilt,
      norm_azi,
      delta,
      xi - xi_0);
    if (type.has_deflector()) {
        text += fmt::format(", chi {}", chi - chi_0);
    }
    if (mapping_axis) {
        text += fmt::format(", mapping axis {}", *mapping_axis);
    }
    return text;
}

std::optional<std::string> find_mapping_axis(const Spectrum &spectrum) {
    std::optional<std::string> mapping;
    for (auto &axis : spectrum.axes()) {
        if (axis.name == "theta_par" || axis.name == "eV" || axis.name == "hv") {
            continue;
        }
        if (std::find(
              supported_mapping_axes.begin(), supported_mapping_axes.end(), axis.name)
            == supported_mapping_axes.end()) {
            throw UnsupportedGeometryError(fmt::format(
              "Cannot convert along '{}': mapping axis must be one of polar, tilt, "
              "defl_perp or ana_polar",
              axis.name));
        }
        if (mapping) {
            throw UnsupportedGeometryError(
              fmt::format("Only one mapping axis is supported, found '{}' and '{}'",
                          *mapping,
                          axis.name));
        }
        mapping = axis.name;
    }
    return mapping;
}

namespace {

/// Angle lookup honouring axes, overrides and metadata, in that order
class AngleSource {
  public:
    AngleSource(const Spectrum &spectrum, const ManipulatorAngles &overrides)
        : _spectrum(spectrum), _angles(spectrum.metadata().angles) {
        _angles.update(overrides);
    }

    bool is_axis(std::string_view name) const {
        return _spectrum.has_axis(name);
    }
    bool present(std::string_view name) const {
        return is_axis(name) || _angles.get(name).has_value();
    }
    /// Scalar value, or 0 when the angle is scanned or absent
    double scalar(std::string_view name) const {
        if (is_axis(name)) return 0.0;
        return _angles.get(name).value_or(0.0);
    }
    std::optional<double> value(std::string_view name) const {
        if (is_axis(name)) return std::nullopt;
        return _angles.get(name);
    }

  private:
    const Spectrum &_spectrum;
    ManipulatorAngles _angles;
};

void require_nonzero(double sign, std::string_view name) {
    if (sign == 0) {
        throw ConfigurationError(fmt::format(
          "Beamline convention gives {} a sign of 0 but it is a scanned axis", name));
    }
}

}  // namespace

AnalyserGeometry resolve_geometry(const Spectrum &spectrum,
                                  const BeamlineConvention &convention,
                                  const ManipulatorAngles &overrides,
                                  ConversionWarnings &warnings) {
    const auto &metadata = spectrum.metadata();
    if (!spectrum.has_axis("theta_par")) {
        throw ConfigurationError("Spectrum has no theta_par axis");
    }
    if (!metadata.ana_slit_angle) {
        throw ConfigurationError("Analyser slit orientation (ana_slit_angle) is missing");
    }
    bool type_one;
    if (*metadata.ana_slit_angle == 90) {
        type_one = true;
    } else if (*metadata.ana_slit_angle == 0) {
        type_one = false;
    } else {
        throw ConfigurationError(
          fmt::format("Analyser slit angle must be 0 or 90 degrees, got {}",
                      *metadata.ana_slit_angle));
    }

    AngleSource angles(spectrum, overrides);
    for (auto name : {"polar", "tilt", "azi"}) {
        if (!angles.present(name)) {
            throw ConfigurationError(
              fmt::format("Manipulator angle '{}' is missing from the metadata", name));
        }
    }
    auto mapping = find_mapping_axis(spectrum);

    bool deflector = angles.is_axis("defl_perp") || angles.scalar("defl_par") != 0
                     || angles.scalar("defl_perp") != 0;

    AnalyserGeometry geometry;
    if (type_one) {
        geometry.type = deflector ? AnalyserType::Type::Ip : AnalyserType::Type::I;
    } else {
        geometry.type = deflector ? AnalyserType::Type::IIp : AnalyserType::Type::II;
    }
    geometry.mapping_axis = mapping;

    // Normal emission values, defaulting the ones not supplied
    auto normal = [&](std::string_view name, double fallback) {
        if (auto value = angles.value(name)) {
            return *value;
        }
        warnings.warn("{} not specified, assuming a value of {}", name, fallback);
        return fallback;
    };
    double azi = angles.scalar("azi");
    geometry.norm_azi = normal("norm_azi", azi);
    if (type_one) {
        geometry.norm_polar = normal("norm_polar", angles.scalar("polar"));
        geometry.norm_tilt = normal("norm_tilt", 0.0);
    } else {
        geometry.norm_polar = normal("norm_polar", 0.0);
        geometry.norm_tilt = normal("norm_tilt", angles.scalar("tilt"));
    }

    const auto &s = convention;
    double polar = angles.scalar("polar");
    double tilt = angles.scalar("tilt");
    double ana_polar = angles.scalar("ana_polar");

    geometry.delta = (azi - geometry.norm_azi) * s.azi;
    require_nonzero(s.theta_par, "theta_par");

    auto unsupported = [&]() {
        return UnsupportedGeometryError(
          fmt::format("A {} map cannot be converted for a type {} analyser",
                      *mapping,
                      geometry.type.to_string()));
    };

    switch (geometry.type.type) {
    case AnalyserType::Type::I:
        geometry.alpha_map = {s.theta_par, 0.0};
        geometry.beta = polar * s.polar + ana_polar * s.ana_polar;
        geometry.beta_0 = geometry.norm_polar * s.polar;
        geometry.xi = tilt * s.tilt;
        geometry.xi_0 = geometry.norm_tilt * s.tilt;
        if (mapping == "polar") {
            require_nonzero(s.polar, "polar");
            geometry.beta_map = {s.polar, ana_polar * s.ana_polar};
        } else if (mapping == "ana_polar") {
            require_nonzero(s.ana_polar, "ana_polar");
            geometry.beta_map = {s.ana_polar, polar * s.polar};
        } else if (mapping) {
            throw unsupported();
        }
        break;
    case AnalyserType::Type::II:
        geometry.alpha_map = {s.theta_par, 0.0};
        geometry.beta = tilt * s.tilt;
        geometry.beta_0 = geometry.norm_tilt * s.tilt;
        geometry.xi = polar * s.polar + ana_polar * s.ana_polar;
        geometry.xi_0 = geometry.norm_polar * s.polar;
        if (mapping == "tilt") {
            require_nonzero(s.tilt, "tilt");
            geometry.beta_map = {s.tilt, 0.0};
        } else if (mapping) {
            throw unsupported();
        }
        break;
    case AnalyserType::Type::Ip:
    case AnalyserType::Type::IIp:
        geometry.alpha_map = {s.theta_par, angles.scalar("defl_par") * s.defl_par};
        geometry.beta = angles.scalar("defl_perp") * s.defl_perp;
        geometry.xi = tilt * s.tilt;
        geometry.xi_0 = geometry.norm_tilt * s.tilt;
        geometry.chi = polar * s.polar + ana_polar * s.ana_polar;
        geometry.chi_0 = geometry.norm_polar * s.polar;
        if (mapping == "defl_perp") {
            require_nonzero(s.defl_perp, "defl_perp");
            geometry.beta_map = {s.defl_perp, 0.0};
        } else if (mapping) {
            throw unsupported();
        }
        break;
    }

    for (double theta : spectrum.axis("theta_par").values) {
        geometry.alpha_values.push_back(geometry.alpha_map.to_angle(theta));
    }
    if (mapping) {
        for (double value : spectrum.axis(*mapping).values) {
            geometry.beta_values.push_back(geometry.beta_map.to_angle(value));
        }
    } else {
        geometry.beta_values.push_back(geometry.beta);
    }
    return geometry;
}
