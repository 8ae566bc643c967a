#include "util/status.hpp"

std::string
phabstack::repr(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::User:
            return "user";
        case ErrorKind::Process:
            return "process";
        case ErrorKind::Integrity:
            return "integrity";
        case ErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}
