#include "beamline_convention.hpp"

#include <array>
#include <stdexcept>

BeamlineConvention::BeamlineConvention(const json &data) {
    std::array<std::string, 7> required_keys = {
      "theta_par", "polar", "tilt", "azi", "defl_par", "defl_perp", "ana_polar"};
    for (const auto &key : required_keys) {
        if (data.find(key) == data.end()) {
            throw std::invalid_argument("Key " + key
                                        + " is missing from the input convention JSON");
        }
    }
    name = data.value("name", std::string("custom"));
    theta_par = data["theta_par"].get<double>();
    polar = data["polar"].get<double>();
    tilt = data["tilt"].get<double>();
    azi = data["azi"].get<double>();
    defl_par = data["defl_par"].get<double>();
    defl_perp = data["defl_perp"].get<double>();
    ana_polar = data["ana_polar"].get<double>();
}

json BeamlineConvention::to_json() const {
    json convention_data;
    convention_data["name"] = name;
    convention_data["theta_par"] = theta_par;
    convention_data["polar"] = polar;
    convention_data["tilt"] = tilt;
    convention_data["azi"] = azi;
    convention_data["defl_par"] = defl_par;
    convention_data["defl_perp"] = defl_perp;
    convention_data["ana_polar"] = ana_polar;
    return convention_data;
}
