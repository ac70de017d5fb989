/**
 * @file energy_reference.cc
 * @brief Resolution of Fermi level corrections onto an angular axis.
 */
#include "energy_reference.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include "kconv_errors.hpp"

namespace {

// Helper for std::visit over the reference alternatives
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// Sorts a sampled reference by angle and checks it is usable
SampledReference validated(SampledReference sampled) {
    if (sampled.theta_par.size() != sampled.fermi_level.size()) {
        throw ConfigurationError(
          fmt::format("Sampled Fermi level has {} angles but {} energies",
                      sampled.theta_par.size(),
                      sampled.fermi_level.size()));
    }
    if (sampled.theta_par.empty()) {
        throw ConfigurationError("Sampled Fermi level has no samples");
    }
    std::vector<size_t> order(sampled.theta_par.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return sampled.theta_par[a] < sampled.theta_par[b];
    });
    SampledReference sorted;
    for (auto i : order) {
        if (!sorted.theta_par.empty() && sorted.theta_par.back() == sampled.theta_par[i]) {
            throw ConfigurationError(fmt::format(
              "Sampled Fermi level has duplicate angle {}", sampled.theta_par[i]));
        }
        sorted.theta_par.push_back(sampled.theta_par[i]);
        sorted.fermi_level.push_back(sampled.fermi_level[i]);
    }
    return sorted;
}

}  // namespace

double interpolate_extrapolate(std::span<const double> x,
                               std::span<const double> y,
                               double at) {
    if (x.size() == 1) {
        return y[0];
    }
    // Index of the segment containing (or nearest to) the point
    auto upper = std::upper_bound(x.begin(), x.end(), at);
    size_t i = std::distance(x.begin(), upper);
    i = std::clamp<size_t>(i, 1, x.size() - 1) - 1;
    double t = (at - x[i]) / (x[i + 1] - x[i]);
    return y[i] + t * (y[i + 1] - y[i]);
}

EnergyReference energy_reference_from_json(const json &data) {
    if (data.is_null()) {
        return NoReference{};
    }
    if (data.is_number()) {
        return ConstantReference{data.get<double>()};
    }
    if (!data.is_object()) {
        throw std::invalid_argument("EF_correction must be a number or an object");
    }
    if (data.contains("constant")) {
        return ConstantReference{data["constant"].get<double>()};
    }
    if (data.contains("coefficients")) {
        return PolynomialReference{data["coefficients"].get<std::vector<double>>()};
    }
    if (data.contains("theta_par") && data.contains("EF")) {
        return SampledReference{data["theta_par"].get<std::vector<double>>(),
                                data["EF"].get<std::vector<double>>()};
    }
    throw std::invalid_argument(
      "EF_correction object needs 'constant', 'coefficients' or 'theta_par' and 'EF'");
}

json energy_reference_to_json(const EnergyReference &reference) {
    return std::visit(
      overloaded{
        [](const NoReference &) -> json { return nullptr; },
        [](const ConstantReference &c) -> json { return {{"constant", c.fermi_level}}; },
        [](const PolynomialReference &p) -> json {
            return {{"coefficients", p.coefficients}};
        },
        [](const SampledReference &s) -> json {
            return {{"theta_par", s.theta_par}, {"EF", s.fermi_level}};
        }},
      reference);
}

std::string describe(const EnergyReference &reference) {
    return std::visit(
      overloaded{
        [](const NoReference &) -> std::string { return "none"; },
        [](const ConstantReference &c) -> std::string {
            return fmt::format("constant EF = {} eV", c.fermi_level);
        },
        [](const PolynomialReference &p) -> std::string {
            return fmt::format("polynomial EF of degree {}",
                               p.coefficients.empty() ? 0 : p.coefficients.size() - 1);
        },
        [](const SampledReference &s) -> std::string {
            return fmt::format("sampled EF at {} angles", s.theta_par.size());
        }},
      reference);
}

ResolvedEnergyReference::ResolvedEnergyReference(EnergyReference reference,
                                                 std::span<const double> theta_par,
                                                 double photon_energy)
    : _reference(std::move(reference)), _photon_energy(photon_energy) {
    if (auto *sampled = std::get_if<SampledReference>(&_reference)) {
        *sampled = validated(std::move(*sampled));
    }
    if (auto *poly = std::get_if<PolynomialReference>(&_reference)) {
        if (poly->coefficients.empty() || poly->coefficients.size() > 4) {
            throw ConfigurationError(
              fmt::format("Polynomial Fermi level needs 1 to 4 coefficients, got {}",
                          poly->coefficients.size()));
        }
    }
    if (theta_par.empty()) {
        throw ConfigurationError("Cannot resolve a Fermi level on an empty angle axis");
    }
    _max_fermi_level = fermi_level(theta_par[0]);
    _min_fermi_level = _max_fermi_level;
    for (double theta : theta_par) {
        double ef = fermi_level(theta);
        _max_fermi_level = std::max(_max_fermi_level, ef);
        _min_fermi_level = std::min(_min_fermi_level, ef);
    }
}

double ResolvedEnergyReference::fermi_level(double theta_par) const {
    return std::visit(
      overloaded{
        [](const NoReference &) -> double {
            throw MissingReferenceError("No Fermi level reference available");
        },
        [](const ConstantReference &c) { return c.fermi_level; },
        [&](const PolynomialReference &p) {
            // Horner evaluation, highest order first
            double value = 0.0;
            for (auto c = p.coefficients.rbegin(); c != p.coefficients.rend(); ++c) {
                value = value * theta_par + *c;
            }
            return value;
        },
        [&](const SampledReference &s) {
            return interpolate_extrapolate(s.theta_par, s.fermi_level, theta_par);
        }},
      _reference);
}

std::string ResolvedEnergyReference::history() const {
    return std::visit(
      overloaded{[](const NoReference &) -> std::string { return ""; },
                 [](const ConstantReference &) -> std::string {
                     return "Fermi level corrected by a rigid shift";
                 },
                 [](const PolynomialReference &p) -> std::string {
                     switch (p.coefficients.size()) {
                     case 1:
                         return "Fermi level corrected by a rigid shift";
                     case 2:
                         return "Fermi level corrected by a linear fit";
                     case 3:
                         return "Fermi level corrected by a quadratic fit";
                     default:
                         return "Fermi level corrected by a cubic fit";
                     }
                 },
                 [](const SampledReference &) -> std::string {
                     return "Fermi level corrected by an array";
                 }},
      _reference);
}

ResolvedEnergyReference resolve_energy_reference(const EnergyReference &reference,
                                                 std::span<const double> theta_par,
                                                 std::optional<double> photon_energy) {
    if (std::holds_alternative<NoReference>(reference)) {
        throw MissingReferenceError("No Fermi level correction supplied");
    }
    if (!photon_energy) {
        throw MissingReferenceError("Photon energy required but not supplied");
    }
    return ResolvedEnergyReference(reference, theta_par, *photon_energy);
}
