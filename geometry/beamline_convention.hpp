/**
 * @file beamline_convention.hpp
 * @brief Angle sign conventions of a beamline.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

/**
 * @brief Sign applied to each recorded angle before it enters the
 * momentum geometry.
 *
 * A sign of 0 means the angle does not contribute (e.g. ana_polar on a
 * beamline without an analyser rotation).
 */
struct BeamlineConvention {
    std::string name = "default";
    double theta_par = 1;
    double polar = 1;
    double tilt = 1;
    double azi = -1;
    double defl_par = 1;
    double defl_perp = 1;
    double ana_polar = 0;

    BeamlineConvention() = default;

    /**
     * @brief Load a convention from JSON.
     *
     * Every sign key is required; "name" is optional.
     * @throws std::invalid_argument if a key is missing
     */
    explicit BeamlineConvention(const json &data);

    json to_json() const;
};
