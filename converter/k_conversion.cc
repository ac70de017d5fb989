/**
 * @file k_conversion.cc
 * @brief Conversion dispatch and momentum resampling of dispersions and maps.
 */
#include "k_conversion.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

#include "energy/fermi_estimate.hpp"
#include "geometry/analyser_geometry.hpp"
#include "geometry/momentum_mapping.hpp"
#include "grid_bounds.hpp"
#include "interpolation.hpp"
#include "kconv_errors.hpp"
#include "kconv_logger.hpp"
#include "kz_conversion.hpp"
#include "q_conversion.hpp"

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/**
 * How output energies relate to the source energy axis and to the
 * kinetic energy used by the inverse mapping.
 */
struct EnergyPlan {
    /// Output energy axis before any eV/FS selection
    std::vector<double> axis;
    EnergyScale scale = EnergyScale::Kinetic;
    /// Kinetic energy for the inverse mapping is E + ke_offset
    double ke_offset = 0.0;
    /// When set, the source kinetic energy is E + EF(theta_par)
    std::optional<ResolvedEnergyReference> reference;
    std::string history;

    double source_energy(double E, double theta_par) const {
        return reference ? E + reference->fermi_level(theta_par) : E;
    }
};

double work_function_or_default(const SpectrumMetadata &metadata,
                                ConversionWarnings &warnings) {
    if (metadata.work_function) {
        return *metadata.work_function;
    }
    warnings.warn("Work function not specified, assuming {} eV", DEFAULT_WORK_FUNCTION);
    return DEFAULT_WORK_FUNCTION;
}

EnergyPlan plan_energy(const Spectrum &spectrum,
                       const ConversionOptions &options,
                       ConversionWarnings &warnings) {
    const auto &metadata = spectrum.metadata();
    const auto &eV = spectrum.axis("eV");
    EnergyPlan plan;
    plan.axis = eV.values;

    if (metadata.eV_type == EnergyScale::Binding) {
        if (!metadata.hv) {
            throw ConfigurationError(
              "Photon energy (hv) is required to convert a binding energy spectrum");
        }
        plan.scale = EnergyScale::Binding;
        plan.ke_offset = *metadata.hv - work_function_or_default(metadata, warnings);
        plan.history = fmt::format("kinetic energy taken as BE + {:.3f} eV", plan.ke_offset);
        return plan;
    }
    if (!options.convert.binding_energy()) {
        return plan;
    }

    auto reference = resolve_reference_or_estimate(spectrum, warnings);
    double lowest = eV.values.front() - reference.max_fermi_level();
    double highest = eV.values.back() - reference.min_fermi_level();
    if (eV.size() > 1) {
        plan.axis = make_axis(lowest, highest, eV.step());
    } else {
        plan.axis = {lowest};
    }
    plan.scale = EnergyScale::Binding;
    plan.ke_offset = reference.max_fermi_level();
    plan.history = reference.history();
    plan.reference = std::move(reference);
    return plan;
}

Spectrum resample_dispersion(const Spectrum &spectrum,
                             const AnalyserGeometry &geometry,
                             const MomentumMapper &mapper,
                             const GridBounds &bounds,
                             const EnergyPlan &plan,
                             const std::vector<double> &energies,
                             const ConversionOptions &options,
                             ConversionWarnings &warnings,
                             SpectrumMetadata metadata) {
    double dk =
      options.dk.value_or(matching_step(bounds.k_par, spectrum.axis("theta_par").size()));
    Axis k_par{"k_par", select_momentum_axis("k_par", bounds.k_par, dk, options.k_par)};
    double k_perp = bounds.k_perp_mean;
    if (options.k_perp) {
        warnings.warn("A dispersion is a single k_perp cut, ignoring the k_perp selection");
    }
    if (bounds.k_perp_spread > K_PERP_SPREAD_THRESHOLD) {
        warnings.warn(
          "k_perp varies by {:.3f} inverse angstrom over the cut, using its mean {:.3f}",
          bounds.k_perp_spread,
          k_perp);
    }

    GridInterpolator<2> source(spectrum, {"eV", "theta_par"});
    Axis eV{"eV", energies};
    std::vector<double> data;
    data.reserve(eV.size() * k_par.size());
    for (double E : eV.values) {
        double Ek = E + plan.ke_offset;
        for (double k : k_par.values) {
            KVector target = mapper.from_slit_components(k, k_perp);
            AnglePair angles = mapper.inverse(target.kx, target.ky, Ek);
            double theta = geometry.alpha_map.to_coordinate(angles.alpha);
            if (std::isnan(theta)) {
                data.push_back(NaN);
                continue;
            }
            data.push_back(source({plan.source_energy(E, theta), theta}));
        }
    }
    metadata.scalars["k_perp"] = k_perp;
    metadata.history.push_back(fmt::format("Converted to momentum with dk = {:.4f}", dk));
    return Spectrum({eV, k_par}, std::move(data), std::move(metadata));
}

Spectrum resample_map(const Spectrum &spectrum,
                      const AnalyserGeometry &geometry,
                      const MomentumMapper &mapper,
                      const GridBounds &bounds,
                      const EnergyPlan &plan,
                      const std::vector<double> &energies,
                      const ConversionOptions &options,
                      SpectrumMetadata metadata) {
    const std::string &mapping = *geometry.mapping_axis;
    double dk = options.dk.value_or(DEFAULT_MAP_DK);
    Axis k_par{"k_par", select_momentum_axis("k_par", bounds.k_par, dk, options.k_par)};
    Axis k_perp{"k_perp", select_momentum_axis("k_perp", bounds.k_perp, dk, options.k_perp)};
    Axis eV{"eV", energies};
    logger.debug("Resampling {} map onto {} x {} x {} points",
                 mapping,
                 k_perp.size(),
                 eV.size(),
                 k_par.size());

    GridInterpolator<3> source(spectrum, {mapping, "eV", "theta_par"});
    std::vector<double> data;
    data.reserve(k_perp.size() * eV.size() * k_par.size());
    for (double kp : k_perp.values) {
        for (double E : eV.values) {
            double Ek = E + plan.ke_offset;
            for (double k : k_par.values) {
                KVector target = mapper.from_slit_components(k, kp);
                AnglePair angles = mapper.inverse(target.kx, target.ky, Ek);
                double theta = geometry.alpha_map.to_coordinate(angles.alpha);
                double scanned = geometry.beta_map.to_coordinate(angles.beta);
                if (std::isnan(theta) || std::isnan(scanned)) {
                    data.push_back(NaN);
                    continue;
                }
                data.push_back(source({scanned, plan.source_energy(E, theta), theta}));
            }
        }
    }
    metadata.history.push_back(
      fmt::format("Converted {} map to momentum with dk = {:.4f}", mapping, dk));
    return Spectrum({k_perp, eV, k_par}, std::move(data), std::move(metadata));
}

/// Output metadata shared by the momentum and binding energy paths
SpectrumMetadata converted_metadata(const Spectrum &spectrum, const EnergyPlan &plan) {
    SpectrumMetadata metadata = spectrum.metadata();
    metadata.eV_type = plan.scale;
    if (plan.reference) {
        metadata.work_function = plan.reference->work_function();
    }
    if (!plan.history.empty()) {
        metadata.history.push_back(plan.history);
    }
    return metadata;
}

}  // namespace

Spectrum convert_to_k(const Spectrum &spectrum,
                      const ConversionOptions &options,
                      const BeamlineConvention &convention,
                      ConversionWarnings &warnings) {
    auto geometry = resolve_geometry(spectrum, convention, options.angles, warnings);
    MomentumMapper mapper(geometry);
    auto plan = plan_energy(spectrum, options, warnings);
    double fermi_level = 0.0;
    if (options.FS && !options.FS->centre && plan.scale == EnergyScale::Kinetic) {
        fermi_level = resolve_reference_or_estimate(spectrum, warnings).max_fermi_level();
        warnings.warn("No FS centre given on a kinetic energy axis, centring on EF = {:.3f} eV",
                      fermi_level);
    }
    auto selection = select_energies(plan.axis, options, fermi_level);

    auto [lowest, highest] =
      std::minmax_element(selection.values.begin(), selection.values.end());
    auto bounds = estimate_grid_bounds(mapper,
                                       geometry.alpha_values,
                                       geometry.beta_values,
                                       *lowest + plan.ke_offset,
                                       *highest + plan.ke_offset);

    SpectrumMetadata metadata = converted_metadata(spectrum, plan);
    metadata.history.push_back(geometry.describe());

    std::map<std::string, std::string> renames = {{"theta_par", "k_par"}};
    Spectrum converted;
    if (geometry.mapping_axis) {
        renames[*geometry.mapping_axis] = "k_perp";
        converted = resample_map(
          spectrum, geometry, mapper, bounds, plan, selection.values, options, metadata);
    } else {
        converted = resample_dispersion(spectrum,
                                        geometry,
                                        mapper,
                                        bounds,
                                        plan,
                                        selection.values,
                                        options,
                                        warnings,
                                        metadata);
    }
    converted =
      reduce_energy(transpose(converted, substituted_order(spectrum, renames)), selection);
    if (options.k_par && options.k_par->value) {
        converted = squeeze(converted, "k_par");
    }
    if (geometry.mapping_axis && options.k_perp && options.k_perp->value) {
        converted = squeeze(converted, "k_perp");
    }
    return converted;
}

Spectrum convert_to_binding_energy(const Spectrum &spectrum,
                                   const ConversionOptions &options,
                                   ConversionWarnings &warnings) {
    if (spectrum.metadata().eV_type == EnergyScale::Binding) {
        warnings.warn("Spectrum is already in binding energy, returning it unchanged");
        return spectrum;
    }
    auto plan = plan_energy(spectrum, options, warnings);
    auto selection = select_energies(plan.axis, options);

    size_t e = *spectrum.axis_index("eV");
    size_t t = *spectrum.axis_index("theta_par");
    std::vector<Axis> axes = spectrum.axes();
    axes[e].values = selection.values;
    Spectrum converted = Spectrum::filled(axes, NaN, converted_metadata(spectrum, plan));

    AxisLocator locator(spectrum.axis("eV"));
    const auto &theta = spectrum.axis("theta_par").values;
    const auto &source_strides = spectrum.strides();
    const auto &strides = converted.strides();
    auto source = spectrum.data();
    auto output = converted.data();
    for (size_t flat = 0; flat < output.size(); ++flat) {
        size_t base = 0;
        size_t energy_index = 0;
        size_t theta_index = 0;
        for (size_t d = 0; d < axes.size(); ++d) {
            size_t index = (flat / strides[d]) % axes[d].size();
            if (d == e) {
                energy_index = index;
                continue;
            }
            if (d == t) theta_index = index;
            base += index * source_strides[d];
        }
        double KE = plan.source_energy(selection.values[energy_index], theta[theta_index]);
        size_t lower;
        double fraction;
        if (!locator.locate(KE, lower, fraction)) {
            continue;
        }
        double value = 0.0;
        if (fraction < 1.0) {
            value += (1.0 - fraction) * source[base + lower * source_strides[e]];
        }
        if (fraction > 0.0) {
            value += fraction * source[base + (lower + 1) * source_strides[e]];
        }
        output[flat] = value;
    }
    return reduce_energy(converted, selection);
}

ConversionResult convert(const Spectrum &spectrum,
                         const ConversionOptions &options,
                         const BeamlineConvention &convention) {
    options.validate();
    ConversionWarnings warnings;
    Spectrum input = apply_binning(prepare_input(spectrum, options), options, warnings);
    logger.debug("Converting {}-dimensional spectrum to {}",
                 input.ndim(),
                 options.convert.to_string());

    Spectrum converted;
    if (input.has_axis("hv")) {
        converted = convert_hv_scan(input, options, convention, warnings);
    } else {
        switch (options.convert.target) {
        case ConversionTarget::Target::MomentumTransfer:
            converted = convert_to_q(input, options, warnings);
            break;
        case ConversionTarget::Target::BindingEnergy:
            converted = convert_to_binding_energy(input, options, warnings);
            break;
        case ConversionTarget::Target::Momentum:
        case ConversionTarget::Target::Both:
            converted = convert_to_k(input, options, convention, warnings);
            break;
        }
    }
    return {std::move(converted), warnings.take()};
}
