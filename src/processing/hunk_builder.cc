#include "processing/hunk_builder.hpp"

#include "algorithms/myers_greedy.hpp"
#include "output/unified.hpp"
#include "processing/diff_hunk.hpp"
#include "util/mime.hpp"

#include <fmt/format.h>
#include <gsl/span>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace phabstack;

namespace {

const char* const no_newline_marker = "\\ No newline at end of file\n";

void
add_corpus_line(Hunk& hunk, const std::string& line) {
    const char op = line.front();
    hunk.corpus += line;

    if (op == '+') {
        hunk.added++;
    } else if (op == '-') {
        hunk.deleted++;
    }

    if (line.back() != '\n') {
        hunk.corpus += '\n';
        hunk.corpus += no_newline_marker;
        if (op != '+') {
            hunk.old_eof_newline = false;
        }
        if (op != '-') {
            hunk.new_eof_newline = false;
        }
    }
}

}  // namespace

bool
phabstack::is_binary(std::string_view body) {
    return body.find('\0') != std::string_view::npos;
}

Hunk
phabstack::context_only_hunk(const std::vector<Line>& lines) {
    Hunk hunk;
    hunk.old_offset = 1;
    hunk.new_offset = 1;
    hunk.old_length = static_cast<int64_t>(lines.size());
    hunk.new_length = static_cast<int64_t>(lines.size());
    for (const auto& line : lines) {
        hunk.corpus += ' ';
        hunk.corpus += line.line;
    }
    return hunk;
}

bool
phabstack::text_hunks(const std::string& old_body,
                      const std::string& new_body,
                      const std::string& old_path,
                      const std::string& new_path,
                      std::vector<Hunk>& hunks,
                      Status& status) {
    hunks.clear();

    std::vector<Line> old_lines = split_lines(old_body);
    std::vector<Line> new_lines = split_lines(new_body);

    DiffInput<Line> diff_input{gsl::span<Line>{old_lines}, gsl::span<Line>{new_lines}, old_path, new_path};
    DiffResult result = MyersGreedy<Line>(diff_input).compute();
    if (result.status == DiffResultStatus::Failed) {
        return status.set_error(ErrorKind::Internal, fmt::format("diff failed for '{}'", new_path));
    }

    // Equal content under different ids still gets its one hunk, unless both
    // sides are empty (an empty file added or deleted), which has none.
    if (result.status == DiffResultStatus::NoChanges) {
        if (!new_lines.empty()) {
            hunks.push_back(context_only_hunk(new_lines));
        }
        return true;
    }

    // A context as large as the larger side joins everything into one hunk.
    const auto context_size = static_cast<int64_t>(std::max(old_lines.size(), new_lines.size()));
    auto diff_hunks = compose_hunks(result.edit_sequence, context_size);
    auto udiff = unified_diff_render(diff_input, diff_hunks);

    // Skip the "---" and "+++" file header lines.
    for (size_t i = 2; i < udiff.size(); i++) {
        const std::string& line = udiff[i];
        if (line.rfind("@@", 0) == 0) {
            HunkHeader header;
            if (!parse_hunk_header(line, header)) {
                return status.set_error(ErrorKind::Internal,
                                        fmt::format("malformed hunk header '{}' for '{}'", line, new_path));
            }
            Hunk hunk;
            hunk.old_offset = header.old_offset;
            hunk.old_length = header.old_length;
            hunk.new_offset = header.new_offset;
            hunk.new_length = header.new_length;
            hunks.push_back(std::move(hunk));
            continue;
        }

        if (hunks.empty()) {
            return status.set_error(ErrorKind::Internal,
                                    fmt::format("diff line before first hunk header for '{}'", new_path));
        }
        add_corpus_line(hunks.back(), line);
    }

    return true;
}

bool
phabstack::build_hunks(ChangeRecord& change,
                       const std::string& old_body,
                       const std::string& new_body,
                       bool identical,
                       Status& status) {
    const std::string& new_path = change.current_path;
    const std::string& old_path = change.old_path ? *change.old_path : change.current_path;

    change.hunks.clear();
    change.uploads.clear();

    if (is_binary(old_body) || is_binary(new_body)) {
        std::string old_mime = guess_mime_type(old_path);
        std::string new_mime = guess_mime_type(new_path);

        change.binary = true;
        change.file_type = is_image_mime_type(old_mime) || is_image_mime_type(new_mime) ? FileType::Image
                                                                                        : FileType::Binary;
        change.uploads.push_back({UploadSide::Old, old_body, old_mime, std::nullopt});
        change.uploads.push_back({UploadSide::New, new_body, new_mime, std::nullopt});

        spdlog::debug("{}: {} ({} -> {} bytes)", new_path, repr(change.file_type), old_body.size(),
                      new_body.size());
        return true;
    }

    change.binary = false;
    change.file_type = FileType::Text;

    if (identical) {
        change.hunks.push_back(context_only_hunk(split_lines(new_body)));
        return true;
    }

    return text_hunks(old_body, new_body, old_path, new_path, change.hunks, status);
}
