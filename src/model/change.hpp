#pragma once

/*
    Normalized per-path change model of one commit.

    A ChangeSet maps every path touched by a commit to its ChangeRecord. A
    path that only appears as the source of a rename or copy gets a record of
    its own, which collects the destinations in `away_paths`.
*/

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace phabstack {

enum class ChangeKind {
    Add,
    Change,
    Delete,
    MoveAway,
    CopyAway,
    MoveHere,
    CopyHere,
    Multicopy,
};

// Review service type code, 1..8 in declaration order.
int
kind_code(ChangeKind kind);

std::string
repr(ChangeKind kind);

bool
is_away_kind(ChangeKind kind);

enum class FileType {
    Text,
    Image,
    Binary,
};

int
file_type_code(FileType file_type);

std::string
repr(FileType file_type);

struct Hunk {
    int64_t old_offset = 0;
    int64_t old_length = 0;
    int64_t new_offset = 0;
    int64_t new_length = 0;

    bool old_eof_newline = true;
    bool new_eof_newline = true;

    int64_t added = 0;
    int64_t deleted = 0;

    std::string corpus;
};

enum class UploadSide {
    Old,
    New,
};

std::string
repr(UploadSide side);

struct UploadDescriptor {
    UploadSide side;
    std::string bytes;
    std::string mime_type;

    // Assigned by the upload step; must be set before wire translation.
    std::optional<std::string> phid;
};

struct ChangeRecord {
    std::string current_path;
    std::optional<std::string> old_path;
    std::vector<std::string> away_paths;

    std::optional<std::string> old_mode;
    std::optional<std::string> new_mode;

    // Unset while the record only exists as a pending rename/copy source.
    std::optional<ChangeKind> kind;

    // Unset until the content was classified.
    std::optional<bool> binary;
    FileType file_type = FileType::Text;

    std::vector<UploadDescriptor> uploads;
    std::vector<Hunk> hunks;

    // Blob ids from the raw listing; unset for records without content.
    std::optional<std::string> old_blob;
    std::optional<std::string> new_blob;

    bool
    has_content() const {
        return old_blob.has_value() && new_blob.has_value();
    }
};

using ChangeSet = std::map<std::string, ChangeRecord>;

}  // namespace phabstack
