#include "vcs/git_backend.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>

using namespace phabstack;

namespace {

struct CommitField {
    const char* name;
    const char* token;
    std::string CommitNode::*member;
};

// clang-format off
constexpr std::array<CommitField, 6> commit_fields = {{
    {"hash",         "%H",  &CommitNode::hash},
    {"tree",         "%T",  &CommitNode::tree},
    {"author_name",  "%an", &CommitNode::author_name},
    {"author_email", "%ae", &CommitNode::author_email},
    {"author_date",  "%ad", &CommitNode::author_date},
    {"message",      "%B",  &CommitNode::message},
}};
// clang-format on

constexpr bool
fields_are_placeholders() {
    for (const auto& field : commit_fields) {
        if (field.token[0] != '%' || field.token[1] == '\0' || field.member == nullptr) {
            return false;
        }
    }
    return true;
}

static_assert(fields_are_placeholders(), "every commit field needs a format placeholder");

// Field placeholders separated by NUL, followed by the parent list.
std::string
commit_format() {
    std::string format = "--format=";
    for (const auto& field : commit_fields) {
        format += field.token;
        format += "%x00";
    }
    format += "%P";
    return format;
}

std::string
trim_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

std::vector<std::string>
split(const std::string& s, char separator) {
    std::vector<std::string> parts;
    size_t pos = 0;
    for (;;) {
        auto end = s.find(separator, pos);
        if (end == std::string::npos) {
            parts.push_back(s.substr(pos));
            return parts;
        }
        parts.push_back(s.substr(pos, end - pos));
        pos = end + 1;
    }
}

}  // namespace

GitBackend::GitBackend(std::string git_command, std::string work_dir, bool cinnabar)
    : git_command_(std::move(git_command)), work_dir_(std::move(work_dir)), cinnabar_(cinnabar) {}

bool
GitBackend::git(std::vector<std::string> args, ProcessResult& result, Status& status, ProcessOptions options) {
    args.insert(args.begin(), git_command_);
    options.working_dir = work_dir_;
    return run_process(args, options, result, status);
}

bool
GitBackend::require_cinnabar(Status& status) const {
    if (!cinnabar_) {
        return status.set_error(ErrorKind::User, "Mercurial hashes need git-cinnabar, which is disabled");
    }
    return true;
}

bool
GitBackend::resolve(const std::string& rev, std::string& hash, Status& status) {
    ProcessOptions options;
    options.check = false;
    ProcessResult result;
    if (!git({"rev-parse", "--verify", "--quiet", rev + "^{commit}"}, result, status, options)) {
        return false;
    }
    if (result.exit_code != 0) {
        return status.set_error(ErrorKind::User, fmt::format("unknown or ambiguous revision '{}'", rev));
    }
    hash = trim_newlines(result.out);
    return true;
}

bool
GitBackend::read_commit(const std::string& hash, CommitNode& commit, Status& status) {
    ProcessResult result;
    if (!git({"show", "-s", "--date=raw", commit_format(), hash, "--"}, result, status)) {
        return false;
    }

    auto values = split(trim_newlines(result.out), '\0');
    if (values.size() != commit_fields.size() + 1) {
        return status.set_error(ErrorKind::Process,
                                fmt::format("unexpected output of git show for {}: {} fields", hash, values.size()));
    }

    commit = CommitNode{};
    for (size_t i = 0; i < commit_fields.size(); i++) {
        commit.*(commit_fields[i].member) = values[i];
    }
    // %s would fold a multi-line subject, so the title comes from the raw message.
    commit.set_message(std::move(commit.message));
    for (auto& parent : split(values.back(), ' ')) {
        if (!parent.empty()) {
            commit.parents.push_back(std::move(parent));
        }
    }
    return true;
}

bool
GitBackend::raw_changes(const std::string& hash, std::string& listing, Status& status) {
    ProcessResult result;
    if (!git({"diff-tree", "-r", "-z", "--raw", "--no-abbrev", "--no-commit-id", "-M", "-C", "--root", hash}, result,
             status)) {
        return false;
    }
    listing = std::move(result.out);
    return true;
}

bool
GitBackend::read_blob(const std::string& blob, std::string& body, Status& status) {
    ProcessResult result;
    if (!git({"cat-file", "blob", blob}, result, status)) {
        return false;
    }
    body = std::move(result.out);
    return true;
}

bool
GitBackend::secondary_hash(const std::string& hash, std::optional<std::string>& secondary, Status& status) {
    if (!require_cinnabar(status)) {
        return false;
    }
    ProcessResult result;
    if (!git({"cinnabar", "git2hg", hash}, result, status)) {
        return false;
    }

    std::string value = trim_newlines(result.out);
    if (value.empty() || value.find_first_not_of('0') == std::string::npos) {
        secondary.reset();
    } else {
        secondary = value;
    }
    return true;
}

bool
GitBackend::export_bundle(const std::string& path, const std::string& base, const std::string& head, Status& status) {
    if (!require_cinnabar(status)) {
        return false;
    }
    ProcessResult result;
    return git({"cinnabar", "bundle", "--version", "1", path, base + ".." + head}, result, status);
}

bool
GitBackend::commit_tree(const CommitNode& commit,
                        const std::string& parent,
                        const std::string& message,
                        std::string& new_hash,
                        Status& status) {
    ProcessOptions options;
    options.input = message;
    options.env = {
        {"GIT_AUTHOR_NAME", commit.author_name},
        {"GIT_AUTHOR_EMAIL", commit.author_email},
        {"GIT_AUTHOR_DATE", commit.author_date},
    };

    ProcessResult result;
    if (!git({"commit-tree", commit.tree, "-p", parent, "-F", "-"}, result, status, options)) {
        return false;
    }
    new_hash = trim_newlines(result.out);
    return true;
}

bool
GitBackend::update_ref(const std::string& ref,
                       const std::string& new_hash,
                       const std::string& old_hash,
                       Status& status) {
    ProcessResult result;
    return git({"update-ref", "-m", "phabstack: rewrite stack", ref, new_hash, old_hash}, result, status);
}
