#include "interpolation.hpp"

#include <algorithm>

namespace {

/// Fractions this close to a sample are placed on it
constexpr double NODE_TOLERANCE = 1e-12;

double snap_to_node(double fraction) {
    if (fraction < NODE_TOLERANCE) return 0.0;
    if (fraction > 1.0 - NODE_TOLERANCE) return 1.0;
    return fraction;
}

}  // namespace

AxisLocator::AxisLocator(const Axis &axis)
    : _values(axis.values),
      _linear(axis.is_linear()),
      _start(axis.values.front()),
      _step(axis.step()) {}

bool AxisLocator::locate(double x, size_t &index, double &fraction) const {
    size_t n = _values.size();
    if (n == 1) {
        // A single sample only matches its own coordinate
        index = 0;
        fraction = 0.0;
        return x == _values[0];
    }
    // Points a rounding error beyond either end still fall on the axis
    double tolerance = 1e-9 * (_values.back() - _values.front());
    if (!(x >= _values.front() - tolerance && x <= _values.back() + tolerance)) {
        return false;
    }
    x = std::clamp(x, _values.front(), _values.back());
    if (_linear) {
        double position = (x - _start) / _step;
        index = std::min(static_cast<size_t>(position), n - 2);
        fraction = snap_to_node(position - index);
        return true;
    }
    auto upper = std::upper_bound(_values.begin(), _values.end(), x);
    index = std::min<size_t>(std::distance(_values.begin(), upper), n - 1) - 1;
    fraction = snap_to_node((x - _values[index]) / (_values[index + 1] - _values[index]));
    return true;
}
