#include "spectrum_json.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

std::optional<double> optional_number(const json &data, const std::string &key) {
    if (!data.contains(key) || data[key].is_null()) {
        return std::nullopt;
    }
    return data[key].get<double>();
}

void set_optional(json &data, const std::string &key, const std::optional<double> &value) {
    if (value) {
        data[key] = *value;
    }
}

}  // namespace

SpectrumMetadata metadata_from_json(const json &data) {
    SpectrumMetadata metadata;
    if (!data.is_object()) {
        throw std::invalid_argument("Spectrum metadata must be a JSON object");
    }
    metadata.beamline = data.value("beamline", std::string());
    if (data.contains("eV_type")) {
        metadata.eV_type = energy_scale_from_string(data["eV_type"].get<std::string>());
    }
    metadata.hv = optional_number(data, "hv");
    metadata.ana_slit_angle = optional_number(data, "ana_slit_angle");
    for (auto name : ManipulatorAngles::names) {
        if (auto value = optional_number(data, std::string(name))) {
            metadata.angles.set(name, *value);
        }
    }
    if (data.contains("EF_correction")) {
        metadata.EF_correction = energy_reference_from_json(data["EF_correction"]);
    }
    if (data.contains("EF_vs_hv") && !data["EF_vs_hv"].is_null()) {
        metadata.EF_vs_hv = data["EF_vs_hv"].get<std::vector<double>>();
    }
    if (data.contains("KE_delta")) {
        metadata.KE_delta = data["KE_delta"].get<std::vector<double>>();
    }
    metadata.work_function = optional_number(data, "work_function");
    metadata.V0 = optional_number(data, "V0");
    if (data.contains("scalars")) {
        metadata.scalars = data["scalars"].get<std::map<std::string, double>>();
    }
    if (data.contains("history")) {
        metadata.history = data["history"].get<std::vector<std::string>>();
    }
    return metadata;
}

json metadata_to_json(const SpectrumMetadata &metadata) {
    json data;
    data["beamline"] = metadata.beamline;
    data["eV_type"] = to_string(metadata.eV_type);
    set_optional(data, "hv", metadata.hv);
    set_optional(data, "ana_slit_angle", metadata.ana_slit_angle);
    for (auto name : ManipulatorAngles::names) {
        set_optional(data, std::string(name), metadata.angles.get(name));
    }
    data["EF_correction"] = energy_reference_to_json(metadata.EF_correction);
    if (metadata.EF_vs_hv) {
        data["EF_vs_hv"] = *metadata.EF_vs_hv;
    }
    if (!metadata.KE_delta.empty()) {
        data["KE_delta"] = metadata.KE_delta;
    }
    set_optional(data, "work_function", metadata.work_function);
    set_optional(data, "V0", metadata.V0);
    data["scalars"] = metadata.scalars;
    data["history"] = metadata.history;
    return data;
}

Spectrum spectrum_from_json(const json &data) {
    for (const std::string key : {"axes", "data"}) {
        if (data.find(key) == data.end()) {
            throw std::invalid_argument("Key " + key
                                        + " is missing from the input spectrum JSON");
        }
    }
    std::vector<Axis> axes;
    for (const auto &axis : data["axes"]) {
        if (!axis.contains("name") || !axis.contains("values")) {
            throw std::invalid_argument("Every spectrum axis needs a name and values");
        }
        axes.push_back(
          Axis{axis["name"].get<std::string>(), axis["values"].get<std::vector<double>>()});
    }
    std::vector<double> values;
    values.reserve(data["data"].size());
    for (const auto &value : data["data"]) {
        values.push_back(value.is_null() ? std::numeric_limits<double>::quiet_NaN()
                                         : value.get<double>());
    }
    SpectrumMetadata metadata;
    if (data.contains("metadata")) {
        metadata = metadata_from_json(data["metadata"]);
    }
    return Spectrum(std::move(axes), std::move(values), std::move(metadata));
}

json spectrum_to_json(const Spectrum &spectrum) {
    json data;
    data["axes"] = json::array();
    for (const auto &axis : spectrum.axes()) {
        data["axes"].push_back({{"name", axis.name}, {"values", axis.values}});
    }
    json values = json::array();
    for (double value : spectrum.data()) {
        if (std::isnan(value)) {
            values.push_back(nullptr);
        } else {
            values.push_back(value);
        }
    }
    data["data"] = std::move(values);
    data["metadata"] = metadata_to_json(spectrum.metadata());
    return data;
}

Spectrum load_spectrum(const std::filesystem::path &path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("Could not open spectrum file " + path.string());
    }
    return spectrum_from_json(json::parse(f));
}

void save_spectrum(const Spectrum &spectrum, const std::filesystem::path &path) {
    std::ofstream f(path);
    if (!f) {
        throw std::runtime_error("Could not write spectrum file " + path.string());
    }
    f << spectrum_to_json(spectrum).dump(2);
}
