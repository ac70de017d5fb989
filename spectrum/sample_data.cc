#include "sample_data.hpp"

#include <cmath>

#include "geometry/momentum_mapping.hpp"

namespace {

constexpr double HE_I = 21.2;
constexpr double SAMPLE_WORK_FUNCTION = 4.4;
constexpr double DEG2RAD = M_PI / 180.0;

/// Intensity of a parabolic band at binding energy BE and momentum k
double band_intensity(double BE, double k, double temperature_width = 0.01) {
    double band = -0.6 + 3.8 * k * k;
    double width = 0.05;
    double lorentzian = width * width / ((BE - band) * (BE - band) + width * width);
    double fermi = 1.0 / (std::exp(BE / temperature_width) + 1.0);
    return 100.0 * (lorentzian + 0.05) * fermi;
}

SpectrumMetadata sample_metadata() {
    SpectrumMetadata metadata;
    metadata.beamline = "sample";
    metadata.ana_slit_angle = 90;
    metadata.angles.polar = 0.0;
    metadata.angles.tilt = 0.0;
    metadata.angles.azi = 0.0;
    metadata.angles.norm_polar = 0.0;
    metadata.angles.norm_tilt = 0.0;
    metadata.angles.norm_azi = 0.0;
    return metadata;
}

}  // namespace

std::vector<double> linspace(double start, double stop, size_t count) {
    std::vector<double> values(count);
    for (size_t i = 0; i < count; ++i) {
        values[i] = count == 1 ? start : start + (stop - start) * i / (count - 1);
    }
    return values;
}

Spectrum make_sample_dispersion(size_t energy_points) {
    double EF = HE_I - SAMPLE_WORK_FUNCTION;
    Axis theta{"theta_par", linspace(-15, 15, 61)};
    Axis eV{"eV", linspace(EF - 1.0, EF + 0.1, energy_points)};

    std::vector<double> data;
    data.reserve(theta.size() * eV.size());
    for (double t : theta.values) {
        for (double E : eV.values) {
            double k = k_vacuum(E) * std::sin(t * DEG2RAD);
            data.push_back(band_intensity(E - EF, k));
        }
    }
    SpectrumMetadata metadata = sample_metadata();
    metadata.hv = HE_I;
    metadata.EF_correction = ConstantReference{EF};
    return Spectrum({theta, eV}, std::move(data), std::move(metadata));
}

Spectrum make_sample_map(size_t polar_points, size_t energy_points) {
    double EF = HE_I - SAMPLE_WORK_FUNCTION;
    Axis polar{"polar", linspace(-10, 10, polar_points)};
    Axis eV{"eV", linspace(EF - 0.5, EF + 0.05, energy_points)};
    Axis theta{"theta_par", linspace(-15, 15, 61)};

    std::vector<double> data;
    data.reserve(polar.size() * eV.size() * theta.size());
    for (double p : polar.values) {
        for (double E : eV.values) {
            for (double t : theta.values) {
                double kv = k_vacuum(E);
                double kx = kv * std::sin(t * DEG2RAD);
                double ky = kv * std::sin(p * DEG2RAD) * std::cos(t * DEG2RAD);
                data.push_back(band_intensity(E - EF, std::hypot(kx, ky)));
            }
        }
    }
    SpectrumMetadata metadata = sample_metadata();
    metadata.hv = HE_I;
    metadata.angles.polar.reset();
    metadata.EF_correction = ConstantReference{EF};
    return Spectrum({polar, eV, theta}, std::move(data), std::move(metadata));
}

Spectrum make_sample_hv_scan(size_t hv_points) {
    double work_function = 4.5;
    Axis hv{"hv", linspace(60, 70, hv_points)};
    double EF_first = hv.values.front() - work_function;
    // Kinetic energy window of the first scan
    Axis eV{"eV", linspace(EF_first - 1.0, EF_first + 0.1, 56)};
    Axis theta{"theta_par", linspace(-12, 12, 49)};

    std::vector<double> EF_vs_hv;
    std::vector<double> KE_delta;
    std::vector<double> data;
    data.reserve(hv.size() * eV.size() * theta.size());
    for (double h : hv.values) {
        double EF = h - work_function;
        EF_vs_hv.push_back(EF);
        KE_delta.push_back(EF - EF_first);
        for (double E : eV.values) {
            double KE = E + (EF - EF_first);
            for (double t : theta.values) {
                double k = k_vacuum(KE) * std::sin(t * DEG2RAD);
                data.push_back(band_intensity(KE - EF, k));
            }
        }
    }
    SpectrumMetadata metadata = sample_metadata();
    metadata.EF_vs_hv = std::move(EF_vs_hv);
    metadata.KE_delta = std::move(KE_delta);
    metadata.V0 = 12.0;
    return Spectrum({hv, eV, theta}, std::move(data), std::move(metadata));
}
