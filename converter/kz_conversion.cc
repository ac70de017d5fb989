/**
 * @file kz_conversion.cc
 * @brief Three-pass photon energy scan conversion.
 */
#include "kz_conversion.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <optional>
#include <stdexcept>

#include "energy/fermi_estimate.hpp"
#include "geometry/analyser_geometry.hpp"
#include "geometry/momentum_mapping.hpp"
#include "grid_bounds.hpp"
#include "interpolation.hpp"
#include "kconv_errors.hpp"
#include "kconv_logger.hpp"

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
constexpr int MAX_FERMI_FIT_DEGREE = 3;

const std::array<std::string, 3> RAW_ORDER = {"hv", "eV", "theta_par"};

bool strictly_increasing(const std::vector<double> &values) {
    return std::adjacent_find(values.begin(), values.end(), std::greater_equal<double>())
           == values.end();
}

}  // namespace

std::string to_string(KzConverter::Stage stage) {
    switch (stage) {
    case KzConverter::Stage::RawHvCube:
        return "RawHvCube";
    case KzConverter::Stage::EnergyCorrected:
        return "EnergyCorrected";
    case KzConverter::Stage::MomentumConverted:
        return "MomentumConverted";
    case KzConverter::Stage::KzConverted:
        return "KzConverted";
    }
    return "unknown";
}

KzConverter::KzConverter(const Spectrum &cube,
                         const ConversionOptions &options,
                         const BeamlineConvention &convention,
                         ConversionWarnings &warnings)
    : _input_order(cube.axis_names()),
      _options(options),
      _convention(convention),
      _warnings(warnings) {
    if (cube.ndim() != 3
        || !std::all_of(RAW_ORDER.begin(), RAW_ORDER.end(), [&](const std::string &name) {
               return cube.has_axis(name);
           })) {
        throw UnsupportedGeometryError(
          "Photon energy scans must have exactly the axes hv, eV and theta_par");
    }
    const auto &metadata = cube.metadata();
    if (metadata.eV_type != EnergyScale::Kinetic) {
        throw ConfigurationError("Photon energy scans must be recorded in kinetic energy");
    }
    _spectrum = transpose(cube, {"hv", "eV", "theta_par"});
    size_t n_hv = _spectrum.axis("hv").size();

    if (metadata.KE_delta.empty()) {
        _ke_delta.assign(n_hv, 0.0);
    } else if (metadata.KE_delta.size() == n_hv) {
        _ke_delta = metadata.KE_delta;
    } else {
        throw ConfigurationError(
          fmt::format("KE_delta has {} entries for {} photon energies",
                      metadata.KE_delta.size(),
                      n_hv));
    }

    if (!metadata.EF_vs_hv) {
        _fermi_levels = estimate_fermi_levels();
    } else if (metadata.EF_vs_hv->size() == n_hv) {
        _fermi_levels = *metadata.EF_vs_hv;
    } else {
        throw ConfigurationError(
          fmt::format("EF_vs_hv has {} entries for {} photon energies",
                      metadata.EF_vs_hv->size(),
                      n_hv));
    }
}

std::vector<double> KzConverter::estimate_fermi_levels() {
    const auto &hv = _spectrum.axis("hv").values;
    const auto &eV = _spectrum.axis("eV").values;
    size_t n_theta = _spectrum.axis("theta_par").size();
    auto data = _spectrum.data();

    std::optional<double> work_function;
    std::vector<double> edges;
    for (size_t i = 0; i < hv.size(); ++i) {
        std::vector<double> energies(eV.size());
        std::vector<double> edc(eV.size(), 0.0);
        for (size_t j = 0; j < eV.size(); ++j) {
            energies[j] = eV[j] + _ke_delta[i];
            for (size_t k = 0; k < n_theta; ++k) {
                double value = data[(i * eV.size() + j) * n_theta + k];
                if (!std::isnan(value)) edc[j] += value;
            }
        }
        if (auto edge = estimate_fermi_level(energies, edc)) {
            edges.push_back(*edge);
            continue;
        }
        if (!work_function) {
            work_function = _spectrum.metadata().work_function;
            if (!work_function) {
                _warnings.warn("Work function not specified, assuming {} eV",
                               DEFAULT_WORK_FUNCTION);
                work_function = DEFAULT_WORK_FUNCTION;
            }
        }
        logger.debug("No Fermi edge found at hv = {}, using hv - work function", hv[i]);
        edges.push_back(hv[i] - *work_function);
    }

    // Smooth the per-slice estimates with a low order polynomial in centred hv
    double centre = std::accumulate(hv.begin(), hv.end(), 0.0) / hv.size();
    std::vector<double> centred(hv.size());
    std::transform(
      hv.begin(), hv.end(), centred.begin(), [&](double h) { return h - centre; });
    auto coefficients = fit_polynomial(centred, edges, MAX_FERMI_FIT_DEGREE);
    std::vector<double> fitted(hv.size());
    for (size_t i = 0; i < hv.size(); ++i) {
        fitted[i] = evaluate_polynomial(coefficients, centred[i]);
    }
    _warnings.warn(
      "EF_vs_hv not supplied, estimated the Fermi level of each photon energy from the "
      "data with a polynomial fit of degree {}",
      coefficients.size() - 1);
    return fitted;
}

void KzConverter::require_stage(Stage expected, std::string_view step) const {
    if (_stage != expected) {
        throw std::logic_error(fmt::format("{} must run at the {} stage, converter is at {}",
                                           step,
                                           to_string(expected),
                                           to_string(_stage)));
    }
}

void KzConverter::correct_energy() {
    require_stage(Stage::RawHvCube, "correct_energy");
    const auto &metadata = _spectrum.metadata();
    const auto &hv = _spectrum.axis("hv");
    const auto &eV = _spectrum.axis("eV");
    const auto &theta = _spectrum.axis("theta_par");

    // Angle dependent curvature of the Fermi edge, common to every photon energy
    std::vector<double> shift(theta.size(), 0.0);
    std::string shift_history;
    if (!std::holds_alternative<NoReference>(metadata.EF_correction)) {
        auto reference =
          resolve_energy_reference(metadata.EF_correction, theta.values, hv.values.front());
        for (size_t k = 0; k < theta.size(); ++k) {
            shift[k] = reference.shift(theta.values[k]);
        }
        shift_history = reference.history();
    }
    auto [min_shift, max_shift] = std::minmax_element(shift.begin(), shift.end());

    std::vector<double> offset(hv.size());
    for (size_t i = 0; i < hv.size(); ++i) {
        offset[i] = _ke_delta[i] - _fermi_levels[i];
    }
    auto [min_offset, max_offset] = std::minmax_element(offset.begin(), offset.end());
    double lowest = eV.values.front() + *min_offset - *max_shift;
    double highest = eV.values.back() + *max_offset - *min_shift;
    std::vector<double> full_axis =
      eV.size() > 1 ? make_axis(lowest, highest, eV.step()) : std::vector<double>{lowest};
    _energy_selection = select_energies(full_axis, _options);
    Axis binding{"eV", _energy_selection.values};

    GridInterpolator<3> source(_spectrum, RAW_ORDER);
    std::vector<double> data;
    data.reserve(hv.size() * binding.size() * theta.size());
    for (size_t i = 0; i < hv.size(); ++i) {
        for (double BE : binding.values) {
            for (size_t k = 0; k < theta.size(); ++k) {
                double detector = BE - offset[i] + shift[k];
                data.push_back(source({hv.values[i], detector, theta.values[k]}));
            }
        }
    }

    SpectrumMetadata corrected = metadata;
    corrected.eV_type = EnergyScale::Binding;
    corrected.EF_vs_hv = _fermi_levels;
    corrected.KE_delta.assign(hv.size(), 0.0);
    corrected.history.push_back("Converted to binding energy using the Fermi level of each hv");
    if (!shift_history.empty()) {
        corrected.history.push_back(shift_history);
    }
    _spectrum = Spectrum({hv, binding, theta}, std::move(data), std::move(corrected));
    _stage = Stage::EnergyCorrected;
    logger.debug("kz conversion: energy corrected onto {} binding energies", binding.size());
}

void KzConverter::convert_momentum() {
    require_stage(Stage::EnergyCorrected, "convert_momentum");
    auto geometry = resolve_geometry(_spectrum, _convention, _options.angles, _warnings);
    MomentumMapper mapper(geometry);
    const auto &hv = _spectrum.axis("hv");
    const auto &binding = _spectrum.axis("eV");
    const auto &theta = _spectrum.axis("theta_par");

    auto [min_EF, max_EF] = std::minmax_element(_fermi_levels.begin(), _fermi_levels.end());
    auto bounds = estimate_grid_bounds(mapper,
                                       geometry.alpha_values,
                                       geometry.beta_values,
                                       binding.values.front() + *min_EF,
                                       binding.values.back() + *max_EF);
    _k_perp = bounds.k_perp_mean;
    if (bounds.k_perp_spread > K_PERP_SPREAD_THRESHOLD) {
        _warnings.warn(
          "k_perp varies by {:.3f} inverse angstrom over the scan, using its mean {:.3f}",
          bounds.k_perp_spread,
          _k_perp);
    }

    double dk = _options.dk.value_or(matching_step(bounds.k_par, theta.size()));
    Axis k_par{"k_par", select_momentum_axis("k_par", bounds.k_par, dk, _options.k_par)};
    _squeeze_k_par = _options.k_par && _options.k_par->value;
    if (_options.k_perp) {
        _warnings.warn(
          "A photon energy scan is a single k_perp cut, ignoring the k_perp selection");
    }

    GridInterpolator<3> source(_spectrum, RAW_ORDER);
    std::vector<double> data;
    data.reserve(hv.size() * binding.size() * k_par.size());
    for (size_t i = 0; i < hv.size(); ++i) {
        for (double BE : binding.values) {
            double KE = BE + _fermi_levels[i];
            for (double k : k_par.values) {
                KVector target = mapper.from_slit_components(k, _k_perp);
                AnglePair angles = mapper.inverse(target.kx, target.ky, KE);
                double t = geometry.alpha_map.to_coordinate(angles.alpha);
                data.push_back(std::isnan(t) ? NaN : source({hv.values[i], BE, t}));
            }
        }
    }

    SpectrumMetadata converted = _spectrum.metadata();
    converted.scalars["k_perp"] = _k_perp;
    converted.history.push_back(geometry.describe());
    converted.history.push_back(fmt::format("Converted to momentum with dk = {:.4f}", dk));
    _spectrum = Spectrum({hv, binding, k_par}, std::move(data), std::move(converted));
    _stage = Stage::MomentumConverted;
}

void KzConverter::convert_kz() {
    require_stage(Stage::MomentumConverted, "convert_kz");
    const auto &hv = _spectrum.axis("hv");
    const auto &binding = _spectrum.axis("eV");
    const auto &k_par = _spectrum.axis("k_par");
    if (hv.size() < 2) {
        throw ConfigurationError("kz conversion needs at least two photon energies");
    }

    double V0 = DEFAULT_INNER_POTENTIAL;
    if (_spectrum.metadata().V0) {
        V0 = *_spectrum.metadata().V0;
    } else {
        _warnings.warn("Inner potential not specified, assuming V0 = {} eV", V0);
    }

    /*
     * Each output cell needs the photon energy whose Fermi level puts the
     * final state at the requested kz. EF(hv) is inverted by linear
     * interpolation when it increases monotonically; otherwise a constant
     * mean work function relates hv and EF.
     */
    bool monotonic = strictly_increasing(_fermi_levels);
    double mean_work_function = 0.0;
    for (size_t i = 0; i < hv.size(); ++i) {
        mean_work_function += (hv.values[i] - _fermi_levels[i]) / hv.size();
    }
    if (!monotonic) {
        _warnings.warn(
          "Fermi level does not increase with photon energy, using a constant work "
          "function of {:.3f} eV",
          mean_work_function);
    }
    AxisLocator fermi_locator(Axis{"EF", monotonic ? _fermi_levels : hv.values});
    auto photon_energy = [&](double EF) {
        if (!monotonic) {
            return EF + mean_work_function;
        }
        size_t index;
        double fraction;
        if (!fermi_locator.locate(EF, index, fraction)) {
            return NaN;
        }
        double lower = hv.values[index];
        double upper = hv.values[std::min(index + 1, hv.size() - 1)];
        return lower + fraction * (upper - lower);
    };

    const double C2 = KVAC_CONST * KVAC_CONST;
    double k_perp2 = _k_perp * _k_perp;
    auto kz_of = [&](double EF, double BE, double k) {
        double argument = V0 + EF + BE - (k * k + k_perp2) / C2;
        return argument >= 0 ? KVAC_CONST * std::sqrt(argument) : NaN;
    };

    // kz is monotonic in EF and BE, and in |k_par|, so the extremes lie at the ends
    auto [min_EF, max_EF] = std::minmax_element(_fermi_levels.begin(), _fermi_levels.end());
    std::vector<double> k_candidates = {k_par.values.front(), k_par.values.back()};
    if (k_par.values.front() < 0 && k_par.values.back() > 0) {
        k_candidates.push_back(0.0);
    }
    MomentumRange range{std::numeric_limits<double>::infinity(),
                        -std::numeric_limits<double>::infinity()};
    for (double EF : {*min_EF, *max_EF}) {
        for (double BE : {binding.values.front(), binding.values.back()}) {
            for (double k : k_candidates) {
                double kz = kz_of(EF, BE, k);
                if (std::isnan(kz)) continue;
                range.min = std::min(range.min, kz);
                range.max = std::max(range.max, kz);
            }
        }
    }
    if (!(range.max >= range.min)) {
        throw ConfigurationError("No photon energy reaches a real kz for V0 = "
                                 + std::to_string(V0));
    }
    double dkz = _options.dkz.value_or(matching_step(range, hv.size()));
    Axis kz{"kz", make_axis(range.min, range.max, dkz)};

    GridInterpolator<3> source(_spectrum, {"hv", "eV", "k_par"});
    std::vector<double> data;
    data.reserve(kz.size() * binding.size() * k_par.size());
    for (double kz_value : kz.values) {
        double final_state = kz_value * kz_value / C2 - V0;
        for (double BE : binding.values) {
            for (double k : k_par.values) {
                double EF = final_state - BE + (k * k + k_perp2) / C2;
                double h = photon_energy(EF);
                data.push_back(std::isnan(h) ? NaN : source({h, BE, k}));
            }
        }
    }

    SpectrumMetadata converted = _spectrum.metadata();
    converted.V0 = V0;
    converted.history.push_back(
      fmt::format("Converted to kz with inner potential V0 = {} eV, dkz = {:.4f}", V0, dkz));
    _spectrum = Spectrum({kz, binding, k_par}, std::move(data), std::move(converted));
    _stage = Stage::KzConverted;
}

Spectrum KzConverter::result() const {
    std::vector<std::string> order;
    for (auto &name : _input_order) {
        if (name == "theta_par" && _spectrum.has_axis("k_par")) {
            order.push_back("k_par");
        } else if (name == "hv" && _spectrum.has_axis("kz")) {
            order.push_back("kz");
        } else {
            order.push_back(name);
        }
    }
    Spectrum output = transpose(_spectrum, order);
    if (_stage == Stage::RawHvCube) {
        return output;
    }
    output = reduce_energy(output, _energy_selection);
    if (_squeeze_k_par) {
        output = squeeze(output, "k_par");
    }
    return output;
}

Spectrum convert_hv_scan(const Spectrum &spectrum,
                         const ConversionOptions &options,
                         const BeamlineConvention &convention,
                         ConversionWarnings &warnings) {
    if (options.convert.target == ConversionTarget::Target::MomentumTransfer) {
        throw ConfigurationError("q conversion is not available for photon energy scans");
    }
    KzConverter converter(spectrum, options, convention, warnings);
    converter.correct_energy();
    if (options.convert.target == ConversionTarget::Target::BindingEnergy) {
        return converter.result();
    }
    if (options.convert.target == ConversionTarget::Target::Momentum) {
        warnings.warn(
          "Photon energy scans are converted to kz in binding energy, ignoring convert = k");
    }
    converter.convert_momentum();
    converter.convert_kz();
    return converter.result();
}
