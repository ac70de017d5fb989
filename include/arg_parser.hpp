/**
 * @file arg_parser.hpp
 * @brief Base argument parser class for kconv applications.
 *
 * Provides the arguments shared by every kconv command line tool
 * (version, verbose output and the input spectrum) and a unified parse
 * step. Extra default arguments are read from a 'kconvert.args' file in
 * the working directory when it exists.
 */
#pragma once

#include <argparse/argparse.hpp>
#include <optional>
#include <string>

/**
 * @brief Structure containing the parsed common arguments.
 */
struct KConvArguments {
    bool verbose = false;               ///< Enable verbose logging output
    std::string file;                   ///< Input spectrum JSON, empty with --sample
    std::optional<std::string> sample;  ///< Kind of synthetic spectrum to generate
};

/**
 * @brief Base argument parser class for kconv applications.
 *
 * Derived classes add their own arguments in their constructor and may
 * override post_parse() to validate them.
 */
class KConvArgumentParser : public argparse::ArgumentParser {
  public:
    explicit KConvArgumentParser(std::string version = "0.1.0");
    virtual ~KConvArgumentParser() = default;

    /**
     * @brief Adds the input spectrum arguments: either a JSON file or
     * --sample with the kind of synthetic data to generate.
     */
    virtual void add_input_arguments();

    /**
     * @brief Parses command-line arguments and returns structured
     * argument data.
     *
     * Prints the usage and exits with status 1 on a parse error.
     *
     * @param argc Number of command-line arguments
     * @param argv Array of command-line argument strings
     * @return KConvArguments Structure containing parsed argument values
     */
    auto parse_args(int argc, char **argv) -> KConvArguments;

  protected:
    /**
     * @brief Post-parsing hook for derived classes to perform
     * additional setup or validation. The base implementation does nothing.
     */
    virtual void post_parse();

    KConvArguments _arguments{};     ///< Internal storage for parsed arguments
    bool _activated_input = false;  ///< Flag indicating if input arguments were added
};
