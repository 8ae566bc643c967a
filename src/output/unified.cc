#include "unified.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <charconv>

using namespace phabstack;

namespace {

std::string
format_range(const int64_t start, const int64_t count) {
    if (count == 1)
        return fmt::format("{}", start);
    return fmt::format("{},{}", start, count);
}

bool
parse_number(const std::string& text, int64_t& value) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && ptr == text.data() + text.size();
}

}  // namespace

std::string
phabstack::format_hunk_header(const DiffHunk& hunk) {
    return fmt::format("@@ -{} +{} @@\n", format_range(hunk.from_start, hunk.from_count),
                       format_range(hunk.to_start, hunk.to_count));
}

bool
phabstack::parse_hunk_header(const std::string& header, HunkHeader& result) {
    static const RE2 header_re(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@)");

    std::string old_offset, old_length, new_offset, new_length;
    if (!RE2::PartialMatch(header, header_re, &old_offset, &old_length, &new_offset, &new_length)) {
        return false;
    }

    if (old_length.empty())
        old_length = "1";
    if (new_length.empty())
        new_length = "1";

    return parse_number(old_offset, result.old_offset) && parse_number(old_length, result.old_length) &&
           parse_number(new_offset, result.new_offset) && parse_number(new_length, result.new_length);
}

std::vector<std::string>
phabstack::unified_diff_render(const DiffInput<Line>& diff_input, const std::vector<DiffHunk>& hunks) {
    std::vector<std::string> udiff;

    udiff.push_back(fmt::format("--- {}\n", diff_input.A_name));
    udiff.push_back(fmt::format("+++ {}\n", diff_input.B_name));

    for (const auto& hunk : hunks) {
        udiff.push_back(format_hunk_header(hunk));
        for (const auto& e : hunk.edit_units) {
            const std::string& text = e.a_index.valid ? diff_input.A[static_cast<size_t>(e.a_index.value)].line
                                                      : diff_input.B[static_cast<size_t>(e.b_index.value)].line;
            char op = ' ';
            if (e.type == EditType::Insert)
                op = '+';
            else if (e.type == EditType::Delete)
                op = '-';

            udiff.push_back(fmt::format("{}{}", op, text));
        }
    }

    return udiff;
}
