#pragma once

/// @file errors.hpp
/// Exception types. Argument errors use std::invalid_argument directly.

#include <stdexcept>
#include <string>
#include <system_error>

namespace fenprobe {

/// A request that cannot be satisfied with the supplied configuration,
/// e.g. more pieces than free squares.
class ConfigurationError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// The engine broke the wire contract: a missing or malformed reply, an
/// echoed position that differs from the submitted one, or an unexpected
/// exit outside the position check.
class ProtocolError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// An operation was invoked in the wrong session state.
class UsageError : public std::logic_error {
   public:
    using std::logic_error::logic_error;
};

/// An OS call on the child process failed.
class ProcessError : public std::system_error {
   public:
    ProcessError(int err, const std::string& what)
        : std::system_error(err, std::generic_category(), what) {}
};

}  // namespace fenprobe
