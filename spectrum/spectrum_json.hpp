/**
 * @file spectrum_json.hpp
 * @brief JSON interchange of spectra and their metadata.
 *
 * A spectrum is stored as
 *
 *   {
 *     "axes": [{"name": "theta_par", "values": [...]}, ...],
 *     "data": [...],
 *     "metadata": {...}
 *   }
 *
 * with "data" flattened in row-major order over the listed axes. NaN
 * intensities are written as null.
 */
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

#include "spectrum.hpp"

using json = nlohmann::json;

/**
 * @brief Load metadata from JSON. Every key is optional.
 * @throws std::invalid_argument for malformed values
 */
SpectrumMetadata metadata_from_json(const json &data);
json metadata_to_json(const SpectrumMetadata &metadata);

/**
 * @brief Load a spectrum from JSON.
 * @throws std::invalid_argument if "axes" or "data" is missing or the
 * sizes do not agree
 */
Spectrum spectrum_from_json(const json &data);
json spectrum_to_json(const Spectrum &spectrum);

/// Read a spectrum from a JSON file
Spectrum load_spectrum(const std::filesystem::path &path);
/// Write a spectrum to a JSON file
void save_spectrum(const Spectrum &spectrum, const std::filesystem::path &path);
