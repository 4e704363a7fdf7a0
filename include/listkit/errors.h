/// @file errors.h
/// @brief Exception types for listkit contract violations.

#pragma once

#include <listkit/api.h>

#include <stdexcept>
#include <string>

namespace listkit {

/// Thrown when a caller breaks a documented precondition, e.g. appending items
/// while no section exists. These are programmer errors; callers are not
/// expected to recover from them.
class precondition_error : public std::logic_error {
public:
    explicit precondition_error(const std::string& what) : std::logic_error(what) {}
    explicit precondition_error(const char* what) : std::logic_error(what) {}
};

} // namespace listkit
