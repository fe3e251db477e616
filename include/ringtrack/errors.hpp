#pragma once

/// @file include/ringtrack/errors.hpp
/// @brief Exception hierarchy for structural errors.
///
/// Numerical routines report failure through std::optional. Exceptions are
/// reserved for malformed input: bad element attributes, unknown pass
/// methods, bad observation points and unreadable lattice files.

#include <stdexcept>
#include <string>

namespace ringtrack {

/// Base class of every exception thrown by ringtrack.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// An element attribute is missing or cannot be converted.
class ElementError : public Error {
public:
    using Error::Error;
};

/// Tracking cannot proceed: missing pass method, bad arguments.
class TrackingError : public Error {
public:
    using Error::Error;
};

/// Observation points are out of range or not sorted.
class RefptsError : public Error {
public:
    using Error::Error;
};

/// A lattice description could not be parsed.
class ParseError : public Error {
public:
    using Error::Error;
};

/// A lattice file could not be opened or has no registered loader.
class LoadError : public Error {
public:
    using Error::Error;
};

} // namespace ringtrack
