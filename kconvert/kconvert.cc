/**
 * @file kconvert.cc
 * @brief Command line driver converting ARPES spectra to momentum.
 *
 * Loads a spectrum from JSON (or generates sample data), converts it
 * with the options given on the command line and writes the result as
 * JSON.
 */
#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

#include "common.hpp"
#include "converter/k_conversion.hpp"
#include "kconv_errors.hpp"
#include "kconv_logger.hpp"
#include "kconvert_args.hpp"
#include "spectrum/sample_data.hpp"
#include "spectrum/spectrum_json.hpp"
#include "version.hpp"

using json = nlohmann::json;

namespace {

json read_json(const std::string &path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("Could not open " + path);
    }
    return json::parse(f);
}

Spectrum sample_spectrum(const std::string &kind) {
    if (kind == "map") {
        return make_sample_map();
    } else if (kind == "hv") {
        return make_sample_hv_scan();
    }
    return make_sample_dispersion();
}

/// Print the first 2D slice of a spectrum, last axis across
void preview(const Spectrum &spectrum) {
    auto shape = spectrum.shape();
    if (shape.empty()) {
        return;
    }
    size_t width = shape.back();
    size_t height = shape.size() > 1 ? shape[shape.size() - 2] : 1;
    fmt::print("Rows: {}, columns: {}\n",
               bold(spectrum.axes()[shape.size() > 1 ? shape.size() - 2 : 0].name),
               bold(spectrum.axes().back().name));
    draw_image_data(spectrum.data(),
                    0,
                    0,
                    std::min<size_t>(width, 16),
                    std::min<size_t>(height, 16),
                    width,
                    height);
}

}  // namespace

int main(int argc, char **argv) {
    logger.info("kconvert version: {}", KCONV_VERSION);
    KConvertArgumentParser parser(KCONV_VERSION);
    auto args = parser.parse_args(argc, argv);
    if (args.verbose) {
        logger.set_level(spdlog::level::debug);
    }

    try {
        Spectrum spectrum;
        if (args.sample) {
            logger.info("Using generated {} spectrum", *args.sample);
            spectrum = sample_spectrum(*args.sample);
        } else {
            logger.info("Loading spectrum from {}", args.file);
            spectrum = load_spectrum(args.file);
        }

        ConversionOptions options;
        if (auto path = parser.present("--options")) {
            options = ConversionOptions::from_json(read_json(*path));
        }
        parser.update_options(options);

        BeamlineConvention convention;
        if (auto path = parser.present("--convention")) {
            convention = BeamlineConvention(read_json(*path));
        }
        logger.info("Using {} beamline convention", convention.name);

        auto start = std::chrono::steady_clock::now();
        auto result = convert(spectrum, options, convention);
        double elapsed =
          std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        std::vector<std::string> shape;
        for (auto &axis : result.spectrum.axes()) {
            shape.push_back(fmt::format("{}: {}", axis.name, axis.size()));
        }
        logger.info("Converted in {:.2f} s to ({})", elapsed, fmt::join(shape, ", "));
        for (auto &warning : result.warnings) {
            fmt::print("{}: {}\n", bold(yellow("Warning")), yellow(warning));
        }
        for (auto &[name, value] : result.spectrum.metadata().scalars) {
            logger.info("{} = {:.4f}", name, value);
        }

        if (parser.get<bool>("--preview")) {
            preview(result.spectrum);
        }
        if (auto output = parser.present("--output")) {
            save_spectrum(result.spectrum, *output);
            logger.info("Wrote converted spectrum to {}", *output);
        }
    } catch (const ConversionError &err) {
        logger.error("Conversion failed: {}", err.what());
        std::exit(1);
    } catch (const std::exception &err) {
        logger.error(err.what());
        std::exit(1);
    }
    return 0;
}
