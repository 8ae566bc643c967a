#include "util/readlines.hpp"

#include "util/hash.hpp"

std::vector<phabstack::Line>
phabstack::split_lines(std::string_view body) {
    std::vector<Line> lines;

    uint32_t line_number = 1;
    std::string_view::size_type pos = 0;
    while (pos < body.size()) {
        auto end = body.find('\n', pos);
        end = end == std::string_view::npos ? body.size() : end + 1;

        std::string line{body.substr(pos, end - pos)};
        uint32_t checksum = hash::hash(line);
        lines.push_back({line_number, checksum, std::move(line)});

        line_number++;
        pos = end;
    }

    return lines;
}
