#include "processing/raw_change_parser.hpp"

#include "processing/hunk_builder.hpp"
#include "vcs/backend.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>

using namespace phabstack;

namespace {

// Cursor over the NUL-terminated tokens of a listing.
class TokenReader {
   public:
    explicit TokenReader(std::string_view listing) : listing_(listing) {}

    bool
    at_end() const {
        return pos_ >= listing_.size();
    }

    bool
    next(std::string_view& token) {
        if (at_end()) {
            return false;
        }
        auto end = listing_.find('\0', pos_);
        if (end == std::string_view::npos) {
            end = listing_.size();
        }
        token = listing_.substr(pos_, end - pos_);
        pos_ = end + 1;
        return true;
    }

   private:
    std::string_view listing_;
    size_t pos_ = 0;
};

std::vector<std::string_view>
split_fields(std::string_view meta) {
    std::vector<std::string_view> fields;
    size_t pos = 0;
    while (pos < meta.size()) {
        auto end = meta.find(' ', pos);
        if (end == std::string_view::npos) {
            end = meta.size();
        }
        if (end > pos) {
            fields.push_back(meta.substr(pos, end - pos));
        }
        pos = end + 1;
    }
    return fields;
}

bool
parse_meta(std::string_view meta, RawChange& record, Status& status) {
    if (meta.empty() || meta.front() != ':') {
        return status.set_error(ErrorKind::User, fmt::format("malformed raw change record '{}'", meta));
    }

    auto fields = split_fields(meta.substr(1));
    if (fields.size() != 5 || fields[4].empty()) {
        return status.set_error(ErrorKind::User, fmt::format("malformed raw change record '{}'", meta));
    }

    record.old_mode = std::string(fields[0]);
    record.new_mode = std::string(fields[1]);
    record.old_blob = std::string(fields[2]);
    record.new_blob = std::string(fields[3]);
    record.status = fields[4].front();

    auto score = fields[4].substr(1);
    if (!score.empty()) {
        int value = 0;
        auto [end, ec] = std::from_chars(score.data(), score.data() + score.size(), value);
        if (ec != std::errc{} || end != score.data() + score.size()) {
            return status.set_error(ErrorKind::User, fmt::format("malformed similarity score in '{}'", meta));
        }
        record.score = value;
    }
    return true;
}

ChangeRecord&
record_for(ChangeSet& changes, const std::string& path) {
    auto it = changes.find(path);
    if (it == changes.end()) {
        ChangeRecord change;
        change.current_path = path;
        it = changes.emplace(path, std::move(change)).first;
    }
    return it->second;
}

void
set_modes_if_changed(ChangeRecord& change, const RawChange& record) {
    if (record.old_mode != record.new_mode) {
        change.old_mode = record.old_mode;
        change.new_mode = record.new_mode;
    }
}

void
set_blobs(ChangeRecord& change, const RawChange& record) {
    change.old_blob = record.old_blob;
    change.new_blob = record.new_blob;
}

// Kind of a rename or copy source after one more destination was seen. A
// rename of a source already moved or copied away makes it a multicopy; a copy
// only does so when the source was moved away. Repeated copies stay CopyAway.
ChangeKind
merge_away_kind(const std::optional<ChangeKind>& current, ChangeKind away) {
    if (!current.has_value() || !is_away_kind(*current)) {
        return away;
    }
    if (*current == ChangeKind::Multicopy) {
        return ChangeKind::Multicopy;
    }
    if (away == ChangeKind::MoveAway || *current == ChangeKind::MoveAway) {
        return ChangeKind::Multicopy;
    }
    return ChangeKind::CopyAway;
}

}  // namespace

bool
phabstack::is_null_blob(const std::string& blob) {
    return blob.empty() || blob.find_first_not_of('0') == std::string::npos;
}

bool
phabstack::parse_raw_changes(std::string_view listing, std::vector<RawChange>& records, Status& status) {
    TokenReader reader(listing);
    std::string_view token;

    while (reader.next(token)) {
        if (token.empty() && reader.at_end()) {
            break;
        }

        RawChange record;
        if (!parse_meta(token, record, status)) {
            return false;
        }

        int path_count = 0;
        switch (record.status) {
            case 'A':
            case 'D':
            case 'M':
                path_count = 1;
                break;
            case 'R':
            case 'C':
                path_count = 2;
                break;
            default: {
                std::string_view path;
                reader.next(path);
                return status.set_error(ErrorKind::User, fmt::format("unsupported change status '{}' for '{}'",
                                                                     record.status, path));
            }
        }

        std::string_view first, second;
        if (!reader.next(first) || (path_count == 2 && !reader.next(second))) {
            return status.set_error(ErrorKind::User,
                                    fmt::format("raw change listing ends inside a '{}' record", record.status));
        }

        if (path_count == 2) {
            record.source_path = std::string(first);
            record.path = std::string(second);
        } else {
            record.path = std::string(first);
        }
        records.push_back(std::move(record));
    }

    return true;
}

bool
phabstack::merge_raw_changes(const std::vector<RawChange>& records, ChangeSet& changes, Status& status) {
    for (const auto& record : records) {
        switch (record.status) {
            case 'A': {
                auto& change = record_for(changes, record.path);
                change.kind = ChangeKind::Add;
                change.new_mode = record.new_mode;
                set_blobs(change, record);
                break;
            }
            case 'D': {
                auto& change = record_for(changes, record.path);
                change.kind = ChangeKind::Delete;
                change.old_mode = record.old_mode;
                change.old_path = record.path;
                set_blobs(change, record);
                break;
            }
            case 'M': {
                auto& change = record_for(changes, record.path);
                change.kind = ChangeKind::Change;
                change.old_path = record.path;
                set_modes_if_changed(change, record);
                set_blobs(change, record);
                break;
            }
            case 'R':
            case 'C': {
                if (!record.source_path.has_value()) {
                    return status.set_error(ErrorKind::Internal,
                                            fmt::format("'{}' record for '{}' has no source path", record.status,
                                                        record.path));
                }
                const bool rename = record.status == 'R';

                auto& change = record_for(changes, record.path);
                change.kind = rename ? ChangeKind::MoveHere : ChangeKind::CopyHere;
                change.old_path = record.source_path;
                set_modes_if_changed(change, record);
                set_blobs(change, record);

                auto& source = record_for(changes, *record.source_path);
                source.kind = merge_away_kind(source.kind, rename ? ChangeKind::MoveAway : ChangeKind::CopyAway);
                if (!source.old_path.has_value()) {
                    source.old_path = source.current_path;
                }
                source.away_paths.push_back(record.path);
                break;
            }
            default:
                return status.set_error(ErrorKind::Internal,
                                        fmt::format("unexpected change status '{}' for '{}'", record.status,
                                                    record.path));
        }
    }
    return true;
}

bool
phabstack::build_change_set(Backend& backend, const CommitNode& commit, ChangeSet& changes, Status& status) {
    std::string listing;
    if (!backend.raw_changes(commit.hash, listing, status)) {
        return false;
    }

    std::vector<RawChange> records;
    if (!parse_raw_changes(listing, records, status)) {
        return false;
    }
    if (!merge_raw_changes(records, changes, status)) {
        return false;
    }

    for (auto& [path, change] : changes) {
        if (!change.has_content()) {
            continue;
        }

        std::string old_body, new_body;
        if (!is_null_blob(*change.old_blob) && !backend.read_blob(*change.old_blob, old_body, status)) {
            return false;
        }
        if (!is_null_blob(*change.new_blob) && !backend.read_blob(*change.new_blob, new_body, status)) {
            return false;
        }

        const bool identical = *change.old_blob == *change.new_blob;
        if (!build_hunks(change, old_body, new_body, identical, status)) {
            return false;
        }
    }

    spdlog::debug("{}: {} changed paths", commit.short_hash(), changes.size());
    return true;
}
