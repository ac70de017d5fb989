/**
 * @file momentum_mapping.cc
 * @brief Angle to momentum geometry for analyser types I, II, I' and II'.
 */
#include "momentum_mapping.hpp"

#include <algorithm>
#include <limits>

using Eigen::Matrix3d;
using Eigen::Vector3d;

namespace {

constexpr double DEG2RAD = M_PI / 180.0;
constexpr double RAD2DEG = 180.0 / M_PI;
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

Matrix3d rotation_inverse(const RotationAngles &f) {
    Matrix3d t;
    t.row(0) << f.cx * f.cd, f.cx * f.sd, -f.sx;
    t.row(1) << f.sc * f.sx * f.cd - f.cc * f.sd, f.sc * f.sx * f.sd + f.cc * f.cd,
      f.sc * f.cx;
    t.row(2) << f.cc * f.sx * f.cd + f.sc * f.sd, f.cc * f.sx * f.sd - f.sc * f.cd,
      f.cc * f.cx;
    return t;
}

KVector type_i(double alpha, double beta, const RotationAngles &f, double Ek) {
    double kv = k_vacuum(Ek);
    double sa = std::sin(alpha * DEG2RAD), ca = std::cos(alpha * DEG2RAD);
    double sb = std::sin(beta * DEG2RAD), cb = std::cos(beta * DEG2RAD);
    return {kv * ((f.sd * sb + f.cd * f.sx * cb) * ca - f.cd * f.cx * sa),
            kv * ((-f.cd * sb + f.sd * f.sx * cb) * ca - f.sd * f.cx * sa)};
}

KVector type_ii(double alpha, double beta, const RotationAngles &f, double Ek) {
    double kv = k_vacuum(Ek);
    double sa = std::sin(alpha * DEG2RAD), ca = std::cos(alpha * DEG2RAD);
    double sb = std::sin(beta * DEG2RAD), cb = std::cos(beta * DEG2RAD);
    return {kv
              * ((f.sd * f.sx + f.cd * sb * f.cx) * ca
                 - (f.sd * f.cx - f.cd * sb * f.sx) * sa),
            kv
              * ((-f.cd * f.sx + f.sd * sb * f.cx) * ca
                 + (f.cd * f.cx + f.sd * sb * f.sx) * sa)};
}

KVector type_ip(double alpha, double beta, const RotationAngles &f, double Ek) {
    double kv = k_vacuum(Ek);
    double a = alpha * DEG2RAD;
    double b = beta * DEG2RAD;
    double r = std::sqrt(a * a + b * b);
    // sin(r)/r without the 0/0 at normal emission
    double sinc = r == 0.0 ? 1.0 : std::sin(r) / r;
    double cr = std::cos(r);
    return {
      kv
        * ((-a * f.cd * f.cx + b * f.sd * f.cc - b * f.cd * f.sx * f.sc) * sinc
           + (f.sd * f.sc + f.cd * f.sx * f.cc) * cr),
      kv
        * ((-a * f.sd * f.cx - b * f.cd * f.cc - b * f.sd * f.sx * f.sc) * sinc
           - (f.cd * f.sc - f.sd * f.sx * f.cc) * cr)};
}

AnglePair inverse_i(double kx, double ky, const RotationAngles &f, double beta_0, double Ek) {
    double kv = k_vacuum(Ek);
    double k2 = kv * kv - kx * kx - ky * ky;
    if (!(k2 >= 0.0)) {
        return {NaN, NaN};
    }
    double k_normal = std::sqrt(k2);
    double alpha = std::asin((f.sx * k_normal - f.cx * (kx * f.cd + ky * f.sd)) / kv);
    double beta = std::atan((kx * f.sd - ky * f.cd)
                            / (kx * f.sx * f.cd + ky * f.sx * f.sd + f.cx * k_normal));
    return {alpha * RAD2DEG, beta_0 + beta * RAD2DEG};
}

AnglePair inverse_ii(double kx, double ky, const RotationAngles &f, double beta_0, double Ek) {
    double kv = k_vacuum(Ek);
    double k2 = kv * kv - kx * kx - ky * ky;
    if (!(k2 >= 0.0)) {
        return {NaN, NaN};
    }
    double k_normal = std::sqrt(k2);
    double u = kx * f.sd - ky * f.cd;
    double alpha = std::asin((f.sx * std::sqrt(kv * kv - u * u) - f.cx * u) / kv);
    double beta = std::atan((kx * f.cd + ky * f.sd) / k_normal);
    return {alpha * RAD2DEG, beta_0 + beta * RAD2DEG};
}

AnglePair inverse_ip(double kx, double ky, const Matrix3d &t, double Ek) {
    double kv = k_vacuum(Ek);
    double k2 = kv * kv - kx * kx - ky * ky;
    if (!(k2 >= 0.0)) {
        return {NaN, NaN};
    }
    Vector3d k(kx, ky, std::sqrt(k2));
    Vector3d k_analyser = t * k;
    // Component along the analyser axis, clamped against rounding
    double along_axis = std::clamp(k_analyser(2), -kv, kv);
    double transverse = std::sqrt(kv * kv - along_axis * along_axis);
    if (transverse <= 1e-12 * kv) {
        return {0.0, 0.0};
    }
    double scale = -std::acos(along_axis / kv) / transverse;
    return {scale * k_analyser(0) * RAD2DEG, scale * k_analyser(1) * RAD2DEG};
}

}  // namespace

RotationAngles::RotationAngles(double delta, double xi, double chi)
    : sd(std::sin(delta * DEG2RAD)),
      cd(std::cos(delta * DEG2RAD)),
      sx(std::sin(xi * DEG2RAD)),
      cx(std::cos(xi * DEG2RAD)),
      sc(std::sin(chi * DEG2RAD)),
      cc(std::cos(chi * DEG2RAD)) {}

Matrix3d deflector_rotation_inverse(double delta, double xi, double chi) {
    return rotation_inverse(RotationAngles(delta, xi, chi));
}

KVector forward_type_i(double alpha, double beta, double delta, double xi, double Ek) {
    return type_i(alpha, beta, RotationAngles(delta, xi), Ek);
}

KVector forward_type_ii(double alpha, double beta, double delta, double xi, double Ek) {
    return type_ii(alpha, beta, RotationAngles(delta, xi), Ek);
}

KVector forward_type_ip(double alpha,
                        double beta,
                        double delta,
                        double xi,
                        double chi,
                        double Ek) {
    return type_ip(alpha, beta, RotationAngles(delta, xi, chi), Ek);
}

// II' is I' with the deflector pair rotated: (alpha, beta) -> (beta, -alpha)
KVector forward_type_iip(double alpha,
                         double beta,
                         double delta,
                         double xi,
                         double chi,
                         double Ek) {
    return type_ip(beta, -alpha, RotationAngles(delta, xi, chi), Ek);
}

AnglePair inverse_type_i(double kx,
                         double ky,
                         double delta,
                         double xi,
                         double beta_0,
                         double Ek) {
    return inverse_i(kx, ky, RotationAngles(delta, xi), beta_0, Ek);
}

AnglePair inverse_type_ii(double kx,
                          double ky,
                          double delta,
                          double xi,
                          double beta_0,
                          double Ek) {
    return inverse_ii(kx, ky, RotationAngles(delta, xi), beta_0, Ek);
}

AnglePair inverse_type_ip(double kx,
                          double ky,
                          double delta,
                          double xi,
                          double chi,
                          double Ek) {
    return inverse_ip(kx, ky, deflector_rotation_inverse(delta, xi, chi), Ek);
}

AnglePair inverse_type_iip(double kx,
                           double ky,
                           double delta,
                           double xi,
                           double chi,
                           double Ek) {
    auto [a, b] = inverse_type_ip(kx, ky, delta, xi, chi, Ek);
    return {-b, a};
}

MomentumMapper::MomentumMapper(const AnalyserGeometry &geometry)
    : _geometry(geometry),
      _fixed(geometry.delta, geometry.xi - geometry.xi_0, geometry.chi - geometry.chi_0),
      _rotation_inverse(rotation_inverse(_fixed)) {}

KVector MomentumMapper::forward(double alpha, double beta, double Ek) const {
    const RotationAngles &f = _fixed;
    switch (_geometry.type.type) {
    case AnalyserType::Type::I:
        return type_i(alpha, beta - _geometry.beta_0, f, Ek);
    case AnalyserType::Type::II:
        return type_ii(alpha, beta - _geometry.beta_0, f, Ek);
    case AnalyserType::Type::Ip:
        return type_ip(alpha, beta, f, Ek);
    case AnalyserType::Type::IIp:
        return type_ip(beta, -alpha, f, Ek);
    }
    return {NaN, NaN};
}

AnglePair MomentumMapper::inverse(double kx, double ky, double Ek) const {
    const RotationAngles &f = _fixed;
    switch (_geometry.type.type) {
    case AnalyserType::Type::I:
        return inverse_i(kx, ky, f, _geometry.beta_0, Ek);
    case AnalyserType::Type::II:
        return inverse_ii(kx, ky, f, _geometry.beta_0, Ek);
    case AnalyserType::Type::Ip:
        return inverse_ip(kx, ky, _rotation_inverse, Ek);
    case AnalyserType::Type::IIp: {
        auto [a, b] = inverse_ip(kx, ky, _rotation_inverse, Ek);
        return {-b, a};
    }
    }
    return {NaN, NaN};
}
