/**
 * @file kconvert_args.hpp
 * @brief Argument parser for the kconvert application.
 *
 * Extends the base kconv argument parser with the conversion options.
 */
#ifndef KCONVERT_ARGS_HPP
#define KCONVERT_ARGS_HPP

#include <fmt/core.h>

#include <vector>

#include "arg_parser.hpp"
#include "common.hpp"
#include "converter/conversion_options.hpp"

/**
 * @brief Argument parser for the kconvert application.
 */
class KConvertArgumentParser : public KConvArgumentParser {
  public:
    KConvertArgumentParser(std::string version) : KConvArgumentParser(version) {
        add_input_arguments();
        add_conversion_arguments();
    }

    void add_conversion_arguments() {
        add_argument("-c", "--convert")
          .help("Conversion target: k, BE, both or q")
          .metavar("TARGET")
          .default_value<std::string>("both");

        add_argument("--dk")
          .help("Momentum spacing (1/Å)")
          .metavar("DK")
          .scan<'g', double>();

        add_argument("--dkz")
          .help("kz spacing for photon energy scans (1/Å)")
          .metavar("DKZ")
          .scan<'g', double>();

        add_argument("-b", "--bin-factor")
          .help("Bin eV and theta_par by this factor before converting. 1 disables binning")
          .metavar("N")
          .scan<'i', int>();

        add_argument("--eV")
          .help("Select one energy, or a window START STOP [STEP]")
          .metavar("E")
          .nargs(1, 3)
          .scan<'g', double>();

        add_argument("--FS")
          .help("Constant energy map: WIDTH [CENTRE], centred on the Fermi level by default")
          .metavar("W")
          .nargs(1, 2)
          .scan<'g', double>();

        add_argument("--k-par")
          .help("Select one k_par along the slit, or a window START STOP [STEP]")
          .metavar("K")
          .nargs(1, 3)
          .scan<'g', double>();

        add_argument("--k-perp")
          .help("For maps, select one k_perp, or a window START STOP [STEP]")
          .metavar("K")
          .nargs(1, 3)
          .scan<'g', double>();

        add_argument("--V0")
          .help("Inner potential (eV)")
          .metavar("V0")
          .scan<'g', double>();

        add_argument("--hv")
          .help("Override the photon energy (eV)")
          .metavar("HV")
          .scan<'g', double>();

        add_argument("--convention")
          .help("Beamline sign convention JSON")
          .metavar("JSON");

        add_argument("--options")
          .help("Conversion options JSON, overridden by the command line")
          .metavar("JSON");

        add_argument("-o", "--output")
          .help("Write the converted spectrum to this JSON file")
          .metavar("FILE");

        add_argument("--preview")
          .help("Draw the first 2D slice of the converted spectrum")
          .default_value(false)
          .implicit_value(true);
    }

    /// Apply the command line options on top of the given options
    void update_options(ConversionOptions &options) const {
        if (is_used("--convert")) {
            options.convert = ConversionTarget(get<std::string>("--convert"));
        }
        if (auto dk = present<double>("--dk")) options.dk = *dk;
        if (auto dkz = present<double>("--dkz")) options.dkz = *dkz;
        if (auto factor = present<int>("--bin-factor")) options.bin_factor = *factor;
        if (auto V0 = present<double>("--V0")) options.V0 = *V0;
        if (auto hv = present<double>("--hv")) options.hv = *hv;
        if (is_used("--eV")) {
            options.eV = selector(get<std::vector<double>>("--eV"));
        }
        if (is_used("--k-par")) {
            options.k_par = selector(get<std::vector<double>>("--k-par"));
        }
        if (is_used("--k-perp")) {
            options.k_perp = selector(get<std::vector<double>>("--k-perp"));
        }
        if (is_used("--FS")) {
            auto values = get<std::vector<double>>("--FS");
            std::optional<double> centre;
            if (values.size() > 1) centre = values[1];
            options.FS = FermiSurfaceSelector{values[0], centre};
        }
    }

  protected:
    void post_parse() override {
        if (_arguments.sample && *_arguments.sample != "dispersion"
            && *_arguments.sample != "map" && *_arguments.sample != "hv") {
            fmt::print("{}: {}\n",
                       bold(red("Error")),
                       red("--sample must be one of dispersion, map or hv"));
            std::exit(1);
        }
    }

  private:
    static CoordinateSelector selector(const std::vector<double> &values) {
        if (values.size() == 1) {
            return CoordinateSelector::at(values[0]);
        }
        std::optional<double> step;
        if (values.size() == 3) step = values[2];
        return CoordinateSelector::between(values[0], values[1], step);
    }
};

#endif  // KCONVERT_ARGS_HPP
