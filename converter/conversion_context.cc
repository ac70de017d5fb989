/**
 * @file conversion_context.cc
 * @brief Shared preparation steps of the conversion drivers.
 */
#include "conversion_context.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

#include "energy/fermi_estimate.hpp"
#include "grid_bounds.hpp"
#include "kconv_errors.hpp"
#include "kconv_logger.hpp"
#include "spectrum/binning.hpp"

Spectrum prepare_input(const Spectrum &spectrum, const ConversionOptions &options) {
    if (!spectrum.has_axis("eV")) {
        throw ConfigurationError("Spectrum has no eV axis");
    }
    if (!spectrum.has_axis("theta_par")) {
        throw ConfigurationError("Spectrum has no theta_par axis");
    }
    Spectrum prepared = spectrum;
    auto &metadata = prepared.metadata();
    metadata.angles.update(options.angles);
    if (options.hv) metadata.hv = options.hv;
    if (options.EF_correction) metadata.EF_correction = *options.EF_correction;
    if (options.V0) metadata.V0 = options.V0;

    // Per-hv coordinates follow the hv axis when it gets reversed
    if (prepared.has_axis("hv")) {
        const auto &hv = prepared.axis("hv").values;
        if (hv.size() > 1 && hv.front() > hv.back()) {
            if (metadata.EF_vs_hv) {
                std::reverse(metadata.EF_vs_hv->begin(), metadata.EF_vs_hv->end());
            }
            std::reverse(metadata.KE_delta.begin(), metadata.KE_delta.end());
        }
    }
    return ensure_increasing(prepared);
}

Spectrum apply_binning(const Spectrum &spectrum,
                       const ConversionOptions &options,
                       ConversionWarnings &warnings) {
    if (options.binning) {
        return bin(spectrum, *options.binning);
    }
    if (options.bin_factor) {
        if (*options.bin_factor == 1) {
            return spectrum;
        }
        return bin(spectrum,
                   BinningSpec{{{"eV", *options.bin_factor},
                                {"theta_par", *options.bin_factor}}});
    }
    if (spectrum.size() > AUTO_BIN_THRESHOLD) {
        BinningSpec spec;
        spec.factors["theta_par"] = 2;
        bool single_slice =
          (options.eV && options.eV->value) || (options.FS && options.FS->width == 0);
        if (!single_slice) {
            spec.factors["eV"] = 2;
        }
        warnings.warn(
          "Spectrum has {} points, binning by {} to keep the conversion tractable. "
          "Set bin_factor to 1 to disable",
          spectrum.size(),
          spec.describe());
        return bin(spectrum, spec);
    }
    return spectrum;
}

std::vector<double> integrated_edc(const Spectrum &spectrum) {
    size_t d = *spectrum.axis_index("eV");
    size_t n = spectrum.axes()[d].size();
    size_t stride = spectrum.strides()[d];
    std::vector<double> edc(n, 0.0);
    auto data = spectrum.data();
    for (size_t flat = 0; flat < data.size(); ++flat) {
        if (!std::isnan(data[flat])) {
            edc[(flat / stride) % n] += data[flat];
        }
    }
    return edc;
}

ResolvedEnergyReference resolve_reference_or_estimate(const Spectrum &spectrum,
                                                      ConversionWarnings &warnings) {
    const auto &metadata = spectrum.metadata();
    const auto &theta = spectrum.axis("theta_par").values;
    try {
        return resolve_energy_reference(metadata.EF_correction, theta, metadata.hv);
    } catch (const MissingReferenceError &e) {
        logger.debug("{}, falling back to an estimate", e.what());
    }

    EnergyReference reference = metadata.EF_correction;
    if (std::holds_alternative<NoReference>(reference)) {
        auto EF = estimate_fermi_level(spectrum.axis("eV").values, integrated_edc(spectrum));
        if (!EF) {
            throw ConfigurationError(
              "No Fermi level correction supplied and too few energy samples to estimate one");
        }
        warnings.warn(
          "No Fermi level correction supplied, estimated EF = {:.3f} eV from the data. "
          "Supply EF_correction for a calibrated conversion",
          *EF);
        reference = ConstantReference{*EF};
    }
    auto hv = metadata.hv;
    if (!hv) {
        double EF_max = ResolvedEnergyReference(reference, theta, 0.0).max_fermi_level();
        hv = estimate_photon_energy(EF_max);
        warnings.warn("Photon energy not supplied, assuming hv = {} eV", *hv);
    }
    return resolve_energy_reference(reference, theta, hv);
}

EnergySelection select_energies(const std::vector<double> &axis,
                                const ConversionOptions &options,
                                double fermi_level) {
    EnergySelection selection;
    double axis_step = axis.size() > 1 ? axis[1] - axis[0] : 0.0;
    if (options.eV && options.eV->value) {
        Axis full{"eV", axis};
        selection.values = {axis[full.nearest(*options.eV->value)]};
        selection.reduction = EnergySelection::Reduction::Squeeze;
    } else if (options.eV && options.eV->window) {
        const auto &window = *options.eV->window;
        double step =
          window.step.value_or(axis_step > 0 ? axis_step : window.stop - window.start);
        if (window.stop == window.start) {
            selection.values = {window.start};
        } else {
            selection.values = make_axis(window.start, window.stop, step);
        }
    } else if (options.FS) {
        double centre = options.FS->centre.value_or(fermi_level);
        double half = options.FS->width / 2;
        for (double E : axis) {
            if (E >= centre - half && E <= centre + half) {
                selection.values.push_back(E);
            }
        }
        if (options.FS->width == 0 || selection.values.empty()) {
            selection.values = {centre};
            selection.reduction = EnergySelection::Reduction::Squeeze;
        } else {
            selection.reduction = EnergySelection::Reduction::Mean;
        }
    } else {
        selection.values = axis;
    }
    if (selection.values.empty()) {
        throw ConfigurationError("Energy selection is empty");
    }
    return selection;
}

Spectrum reduce_energy(const Spectrum &spectrum, const EnergySelection &selection) {
    switch (selection.reduction) {
    case EnergySelection::Reduction::Squeeze:
        return squeeze(spectrum, "eV");
    case EnergySelection::Reduction::Mean:
        return mean_over(spectrum, "eV");
    case EnergySelection::Reduction::None:
        break;
    }
    return spectrum;
}

std::vector<std::string> substituted_order(const Spectrum &input,
                                           const std::map<std::string, std::string> &renames) {
    std::vector<std::string> order;
    for (auto &name : input.axis_names()) {
        auto renamed = renames.find(name);
        order.push_back(renamed == renames.end() ? name : renamed->second);
    }
    return order;
}
