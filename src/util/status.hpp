#pragma once

#include <string>
#include <utility>

namespace phabstack {

// clang-format off
enum class ErrorKind {
    None      = 1 << 0,
    User      = 1 << 1, // Bad input: revisions, ranges, raw listings, bundles
    Process   = 1 << 2, // A backend command failed
    Integrity = 1 << 3, // Corrupt data that must be regenerated, not patched around
    Internal  = 1 << 4, // Caller broke a precondition
};
// clang-format on

struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ErrorKind::None;
    }

    // Always returns false so call sites can `return status.set_error(...)`.
    bool
    set_error(ErrorKind error_kind, std::string error_message) {
        kind = error_kind;
        error = std::move(error_message);
        return false;
    }
};

std::string
repr(ErrorKind kind);

}  // namespace phabstack
