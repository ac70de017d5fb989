/**
 * @file arg_parser.cc
 * @brief Implementation of the base argument parser for kconv
 * applications.
 *
 * Handles the common arguments, loads default arguments from a
 * 'kconvert.args' file and reports parse errors with the usage text.
 */
#include "arg_parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <argparse/argparse.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "common.hpp"

KConvArgumentParser::KConvArgumentParser(std::string version)
    : ArgumentParser("", version, argparse::default_arguments::help) {
    add_argument("--version")
      .help("Print version information and exit")
      .action([=](const auto &) {
          fmt::print("{}\n", version);
          std::exit(0);
      })
      .default_value(false)
      .implicit_value(true)
      .nargs(0);

    add_argument("-v", "--verbose")
      .help("Verbose output")
      .implicit_value(false)
      .action([&](const std::string &) { _arguments.verbose = true; });
}

void KConvArgumentParser::add_input_arguments() {
    // Either a spectrum file or generated sample data, never both
    auto &group = add_mutually_exclusive_group(true);

    group.add_argument("--sample")
      .help("Don't load a spectrum, instead convert generated test data")
      .metavar("{dispersion,map,hv}")
      .action([&](const std::string &val) { _arguments.sample = val; });

    group.add_argument("file")
      .metavar("SPECTRUM.json")
      .help("Path to the spectrum JSON file to convert")
      .nargs(argparse::nargs_pattern::optional)
      .action([&](const std::string &val) { _arguments.file = val; });

    _activated_input = true;
}

auto KConvArgumentParser::parse_args(int argc, char **argv) -> KConvArguments {
    std::vector<std::string> args{argv, argv + argc};

    // Load additional arguments from kconvert.args if it exists
    std::filesystem::path argfile{"kconvert.args"};
    if (std::filesystem::exists(argfile)) {
        std::ifstream f(argfile);
        std::string arg;
        // Read each line as a separate argument
        while (std::getline(f, arg)) {
            if (!arg.empty()
                && std::find(args.begin(), args.end(), arg) == args.end()) {
                args.push_back(arg);
            }
        }
    }

    try {
        ArgumentParser::parse_args(args);
    } catch (const std::runtime_error &e) {
        fmt::print("{}: {}\n{}\n", bold(red("Error")), red(e.what()), usage());
        std::exit(1);
    }

    post_parse();

    return _arguments;
}

void KConvArgumentParser::post_parse() {}
