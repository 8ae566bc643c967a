#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace phabstack {

struct Line {
    uint32_t line_number;
    uint32_t checksum;

    std::string line;

    uint32_t
    hash() const {
        return checksum;
    }

    bool
    has_newline() const {
        return !line.empty() && line.back() == '\n';
    }

    bool
    operator<(const Line& other) const {
        return checksum < other.checksum;
    }

    // The checksum only short-circuits; two lines are equal when their bytes are.
    bool
    operator==(const Line& other) const {
        return checksum == other.checksum && line == other.line;
    }
};

// Split a file body into lines. Every line keeps its trailing '\n'; only the
// last line may lack one. An empty body has no lines.
std::vector<Line>
split_lines(std::string_view body);

}  // namespace phabstack
