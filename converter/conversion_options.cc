#include "conversion_options.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "kconv_errors.hpp"

ConversionTarget::ConversionTarget(std::string input) {
    std::string name = input;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    if (name == "k") {
        target = Target::Momentum;
    } else if (name == "be") {
        target = Target::BindingEnergy;
    } else if (name == "both") {
        target = Target::Both;
    } else if (name == "q") {
        target = Target::MomentumTransfer;
    } else {
        throw std::invalid_argument("Invalid conversion target " + input
                                    + ", expected one of k, BE, both or q");
    }
}

std::string ConversionTarget::to_string() const {
    switch (target) {
    case Target::Momentum:
        return "k";
    case Target::BindingEnergy:
        return "BE";
    case Target::Both:
        return "both";
    case Target::MomentumTransfer:
        return "q";
    }
    return "unknown";
}

void ConversionOptions::validate() const {
    if (binning && bin_factor) {
        throw ConflictingBinningError(
          "Specify either a binning map or a bin_factor, not both");
    }
    if (eV && FS) {
        throw ConflictingOptionsError(
          "Specify either an eV selection or a Fermi surface (FS) width, not both");
    }
    if (eV && eV->value && eV->window) {
        throw ConflictingOptionsError("An eV selection is either a value or a window");
    }
    if (k_par && k_par->value && k_par->window) {
        throw ConflictingOptionsError("A k_par selection is either a value or a window");
    }
    if (k_perp && k_perp->value && k_perp->window) {
        throw ConflictingOptionsError("A k_perp selection is either a value or a window");
    }
    if (dk && *dk <= 0) {
        throw ConfigurationError(fmt::format("dk must be positive, got {}", *dk));
    }
    if (dkz && *dkz <= 0) {
        throw ConfigurationError(fmt::format("dkz must be positive, got {}", *dkz));
    }
    if (bin_factor && *bin_factor < 1) {
        throw ConfigurationError(
          fmt::format("bin_factor must be at least 1, got {}", *bin_factor));
    }
    if (FS && FS->width < 0) {
        throw ConfigurationError(
          fmt::format("FS width must not be negative, got {}", FS->width));
    }
    for (const auto *selector : {&eV, &k_par, &k_perp}) {
        if (*selector && (*selector)->window && (*selector)->window->step
            && *(*selector)->window->step <= 0) {
            throw ConfigurationError("Selection steps must be positive");
        }
    }
}

namespace {

/// A number selects one value, a [start, stop] or [start, stop, step] array a window
CoordinateSelector selector_from_json(const json &data, const std::string &key) {
    if (data.is_number()) {
        return CoordinateSelector::at(data.get<double>());
    }
    if (data.is_array() && (data.size() == 2 || data.size() == 3)) {
        std::optional<double> step;
        if (data.size() == 3) step = data[2].get<double>();
        return CoordinateSelector::between(data[0].get<double>(), data[1].get<double>(), step);
    }
    throw std::invalid_argument("Key " + key
                                + " must be a number or a [start, stop(, step)] array");
}

}  // namespace

ConversionOptions ConversionOptions::from_json(const json &data) {
    ConversionOptions options;
    if (data.contains("convert")) {
        options.convert = ConversionTarget(data["convert"].get<std::string>());
    }
    if (data.contains("dk")) options.dk = data["dk"].get<double>();
    if (data.contains("dkz")) options.dkz = data["dkz"].get<double>();
    if (data.contains("binning")) {
        options.binning = BinningSpec{data["binning"].get<std::map<std::string, int>>()};
    }
    if (data.contains("bin_factor")) options.bin_factor = data["bin_factor"].get<int>();
    if (data.contains("eV")) options.eV = selector_from_json(data["eV"], "eV");
    if (data.contains("FS")) {
        const json &fs = data["FS"];
        if (fs.is_number()) {
            options.FS = FermiSurfaceSelector{fs.get<double>(), std::nullopt};
        } else if (fs.is_array() && fs.size() == 2) {
            options.FS = FermiSurfaceSelector{fs[0].get<double>(), fs[1].get<double>()};
        } else {
            throw std::invalid_argument("Key FS must be a width or a [width, centre] array");
        }
    }
    if (data.contains("k_par")) options.k_par = selector_from_json(data["k_par"], "k_par");
    if (data.contains("k_perp")) {
        options.k_perp = selector_from_json(data["k_perp"], "k_perp");
    }
    if (data.contains("V0")) options.V0 = data["V0"].get<double>();
    if (data.contains("hv")) options.hv = data["hv"].get<double>();
    if (data.contains("EF_correction")) {
        options.EF_correction = energy_reference_from_json(data["EF_correction"]);
    }
    for (auto name : ManipulatorAngles::names) {
        std::string key(name);
        if (data.contains(key)) {
            options.angles.set(name, data[key].get<double>());
        }
    }
    return options;
}
