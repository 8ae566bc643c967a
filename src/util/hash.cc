#include "util/hash.hpp"

#include <crc32c/crc32c.h>

uint32_t
phabstack::hash::hash(const char* input, std::size_t len) {
    return crc32c::Crc32c(input, len);
}

uint32_t
phabstack::hash::hash(const std::string& input) {
    return crc32c::Crc32c(input);
}
