/**
 * @file fermi_estimate.cc
 * @brief Derivative-peak Fermi level estimate and photon energy heuristic.
 */
#include "fermi_estimate.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include "kconv_logger.hpp"

namespace {

/// Index into [0, n) with the edges reflected (d c b a | a b c d | d c b a)
size_t reflect_index(long i, long n) {
    while (i < 0 || i >= n) {
        if (i < 0) i = -i - 1;
        if (i >= n) i = 2 * n - i - 1;
    }
    return static_cast<size_t>(i);
}

/// Central difference derivative, one-sided at the ends
std::vector<double> gradient(std::span<const double> y, std::span<const double> x) {
    size_t n = y.size();
    std::vector<double> d(n);
    d[0] = (y[1] - y[0]) / (x[1] - x[0]);
    d[n - 1] = (y[n - 1] - y[n - 2]) / (x[n - 1] - x[n - 2]);
    for (size_t i = 1; i + 1 < n; ++i) {
        d[i] = (y[i + 1] - y[i - 1]) / (x[i + 1] - x[i - 1]);
    }
    return d;
}

/// Height of a peak above the higher of its two surrounding minima
double prominence(const std::vector<double> &s, size_t peak) {
    double left_min = s[peak];
    for (size_t j = peak; j-- > 0;) {
        if (s[j] > s[peak]) break;
        left_min = std::min(left_min, s[j]);
    }
    double right_min = s[peak];
    for (size_t j = peak + 1; j < s.size(); ++j) {
        if (s[j] > s[peak]) break;
        right_min = std::min(right_min, s[j]);
    }
    return s[peak] - std::max(left_min, right_min);
}

}  // namespace

std::vector<double> gaussian_smooth(std::span<const double> values, double sigma) {
    long n = static_cast<long>(values.size());
    long radius = static_cast<long>(4.0 * sigma + 0.5);
    std::vector<double> kernel(2 * radius + 1);
    for (long i = -radius; i <= radius; ++i) {
        kernel[i + radius] = std::exp(-0.5 * (i * i) / (sigma * sigma));
    }
    double norm = std::accumulate(kernel.begin(), kernel.end(), 0.0);
    std::vector<double> result(values.size(), 0.0);
    for (long i = 0; i < n; ++i) {
        double total = 0.0;
        for (long j = -radius; j <= radius; ++j) {
            total += kernel[j + radius] * values[reflect_index(i + j, n)];
        }
        result[i] = total / norm;
    }
    return result;
}

std::optional<double> estimate_fermi_level(std::span<const double> energy,
                                           std::span<const double> intensity) {
    if (energy.size() != intensity.size()) {
        throw std::invalid_argument("Energy and intensity lengths differ");
    }
    if (energy.size() < 5) {
        return std::nullopt;
    }
    std::vector<double> edc(intensity.begin(), intensity.end());
    for (auto &v : edc) {
        if (std::isnan(v)) v = 0.0;
    }

    /*
     * The sharpest drop in intensity marks the Fermi edge. Peaks of the
     * smoothed -dI/dE are accepted when their prominence clears 2.5 times
     * the residual noise of the derivative, and at least 5% of the
     * derivative's range so that rounding ripples on a perfectly flat
     * tail never qualify.
     */
    static constexpr double NOISE_MULTIPLIER = 2.5;
    static constexpr double MIN_RELATIVE_PROMINENCE = 0.05;

    auto smoothed = gaussian_smooth(edc, 3.0);
    auto derivative = gradient(smoothed, energy);
    for (auto &d : derivative) d = -d;
    auto peak_curve = gaussian_smooth(derivative, 3.0);

    double noise = 0.0;
    for (size_t i = 0; i < derivative.size(); ++i) {
        noise += std::abs(derivative[i] - peak_curve[i]);
    }
    noise /= derivative.size();
    auto [lowest, highest] = std::minmax_element(peak_curve.begin(), peak_curve.end());
    double threshold =
      std::max(NOISE_MULTIPLIER * noise, MIN_RELATIVE_PROMINENCE * (*highest - *lowest));

    std::optional<size_t> edge;
    for (size_t i = 1; i + 1 < peak_curve.size(); ++i) {
        bool is_peak = peak_curve[i] > peak_curve[i - 1] && peak_curve[i] >= peak_curve[i + 1];
        if (is_peak && prominence(peak_curve, i) >= threshold) {
            edge = i;  // Keep the highest-energy candidate
        }
    }
    if (!edge) {
        edge = std::distance(peak_curve.begin(), highest);
        logger.debug("No prominent Fermi edge found, using the steepest drop");
    }
    return std::round(energy[*edge] * 1000.0) / 1000.0;
}

double estimate_photon_energy(double fermi_level) {
    if (fermi_level > 16.5 && fermi_level < 17) {
        return 21.2182;  // He I
    } else if (fermi_level > 1 && fermi_level < 2) {
        return 6.05;  // 6 eV laser
    } else if (fermi_level > 6 && fermi_level < 7) {
        return 10.897;  // 11 eV laser
    }
    return fermi_level + DEFAULT_WORK_FUNCTION;
}

std::vector<double> fit_polynomial(std::span<const double> x,
                                   std::span<const double> y,
                                   int degree) {
    if (x.empty() || x.size() != y.size()) {
        throw std::invalid_argument("Polynomial fit needs matching, non-empty samples");
    }
    degree = std::clamp(degree, 0, static_cast<int>(x.size()) - 1);
    Eigen::MatrixXd vandermonde(x.size(), degree + 1);
    Eigen::VectorXd rhs(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        double power = 1.0;
        for (int j = 0; j <= degree; ++j) {
            vandermonde(i, j) = power;
            power *= x[i];
        }
        rhs(i) = y[i];
    }
    Eigen::VectorXd solution = vandermonde.colPivHouseholderQr().solve(rhs);
    return std::vector<double>(solution.data(), solution.data() + solution.size());
}

double evaluate_polynomial(std::span<const double> coefficients, double x) {
    double value = 0.0;
    for (auto c = coefficients.rbegin(); c != coefficients.rend(); ++c) {
        value = value * x + *c;
    }
    return value;
}
