/**
 * @file kconv_errors.hpp
 * @brief Exception types raised by the conversion engine.
 *
 * Fatal problems (missing geometry, conflicting options, unsupported
 * scan axes) abort a conversion by throwing one of these. A missing
 * energy reference is thrown by the resolvers and caught again by the
 * conversion drivers, which substitute an automatic estimate and record
 * a warning instead of failing.
 */
#pragma once

#include <stdexcept>
#include <string>

/// Base class of every error thrown by the conversion engine
class ConversionError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Required geometry axes or angle metadata are missing, or an option is invalid
class ConfigurationError : public ConversionError {
  public:
    using ConversionError::ConversionError;
};

/// Two mutually exclusive options were supplied together
class ConflictingOptionsError : public ConversionError {
  public:
    using ConversionError::ConversionError;
};

/// Both an explicit binning map and a uniform bin factor were given
class ConflictingBinningError : public ConflictingOptionsError {
  public:
    using ConflictingOptionsError::ConflictingOptionsError;
};

/// Fermi level or photon energy needed but absent
class MissingReferenceError : public ConversionError {
  public:
    using ConversionError::ConversionError;
};

/// The scanned mapping axis cannot be converted for this analyser geometry
class UnsupportedGeometryError : public ConversionError {
  public:
    using ConversionError::ConversionError;
};
