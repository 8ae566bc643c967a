#include "model/change.hpp"

int
phabstack::kind_code(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Add:
            return 1;
        case ChangeKind::Change:
            return 2;
        case ChangeKind::Delete:
            return 3;
        case ChangeKind::MoveAway:
            return 4;
        case ChangeKind::CopyAway:
            return 5;
        case ChangeKind::MoveHere:
            return 6;
        case ChangeKind::CopyHere:
            return 7;
        case ChangeKind::Multicopy:
            return 8;
    }
    return 0;
}

std::string
phabstack::repr(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Add:
            return "ADD";
        case ChangeKind::Change:
            return "CHANGE";
        case ChangeKind::Delete:
            return "DELETE";
        case ChangeKind::MoveAway:
            return "MOVE_AWAY";
        case ChangeKind::CopyAway:
            return "COPY_AWAY";
        case ChangeKind::MoveHere:
            return "MOVE_HERE";
        case ChangeKind::CopyHere:
            return "COPY_HERE";
        case ChangeKind::Multicopy:
            return "MULTICOPY";
    }
    return "UNKNOWN";
}

bool
phabstack::is_away_kind(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::MoveAway:
        case ChangeKind::CopyAway:
        case ChangeKind::Multicopy:
            return true;
        case ChangeKind::Add:
        case ChangeKind::Change:
        case ChangeKind::Delete:
        case ChangeKind::MoveHere:
        case ChangeKind::CopyHere:
            return false;
    }
    return false;
}

int
phabstack::file_type_code(FileType file_type) {
    switch (file_type) {
        case FileType::Text:
            return 1;
        case FileType::Image:
            return 2;
        case FileType::Binary:
            return 3;
    }
    return 0;
}

std::string
phabstack::repr(FileType file_type) {
    switch (file_type) {
        case FileType::Text:
            return "TEXT";
        case FileType::Image:
            return "IMAGE";
        case FileType::Binary:
            return "BINARY";
    }
    return "UNKNOWN";
}

std::string
phabstack::repr(UploadSide side) {
    switch (side) {
        case UploadSide::Old:
            return "old";
        case UploadSide::New:
            return "new";
    }
    return "unknown";
}
