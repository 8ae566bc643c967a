#include "review/commit_message.hpp"

#include <re2/re2.h>

#include <algorithm>

using namespace phabstack;

namespace {

const re2::RE2 bug_re(R"((?i)\b(?:bug\s*|b=)(\d+)\b)");
const re2::RE2 reviewers_re(R"((?i)(?:^|[\s(.\[;,])r([=?])([\w.\-!]+(?:,[\w.\-!]+)*))");
const re2::RE2 revision_re(R"((?mi)^[ \t]*Differential Revision:[ \t]*(\S+)/D(\d+)[ \t]*$)");
const re2::RE2 revision_line_re(R"((?mi)^[ \t]*Differential Revision:.*$)");
const re2::RE2 depends_re(R"((?i)\bDepends on D(\d+)\b)");

void
add_unique(std::vector<std::string>& names, std::string name) {
    while (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(std::move(name));
    }
}

void
add_reviewers(std::vector<std::string>& names, const std::string& list) {
    size_t pos = 0;
    for (;;) {
        auto end = list.find(',', pos);
        add_unique(names, list.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
        if (end == std::string::npos) {
            return;
        }
        pos = end + 1;
    }
}

std::string
to_string(const re2::StringPiece& piece) {
    return std::string(piece.data(), piece.size());
}

}  // namespace

CommitMessage
phabstack::parse_commit_message(const std::string& message) {
    CommitMessage parsed;

    std::string bug;
    if (re2::RE2::PartialMatch(message, bug_re, &bug)) {
        parsed.bug = bug;
    }

    // Match() keeps `^` anchored to the start of the message, which
    // consuming the input would not.
    re2::StringPiece text(message);
    re2::StringPiece groups[3];
    size_t pos = 0;
    while (pos < message.size() &&
           reviewers_re.Match(text, pos, message.size(), re2::RE2::UNANCHORED, groups, 3)) {
        auto& names = groups[1] == "=" ? parsed.reviewers_granted : parsed.reviewers_requested;
        add_reviewers(names, to_string(groups[2]));
        pos = static_cast<size_t>(groups[0].data() - message.data()) + groups[0].size();
    }

    std::string url, id;
    if (re2::RE2::PartialMatch(message, revision_re, &url, &id)) {
        parsed.revision_url = url;
        parsed.revision_id = id;
    }

    re2::StringPiece input(message);
    while (re2::RE2::FindAndConsume(&input, depends_re, &id)) {
        add_unique(parsed.depends_on, id);
    }

    return parsed;
}

std::string
phabstack::revision_link(const std::string& base_url, const std::string& revision_id) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/D" + revision_id;
}

std::string
phabstack::with_revision_link(const std::string& message, const std::string& url) {
    const std::string line = "Differential Revision: " + url;

    std::string rewrite;
    for (char c : line) {
        if (c == '\\') {
            rewrite += '\\';
        }
        rewrite += c;
    }

    std::string result = message;
    if (re2::RE2::Replace(&result, revision_line_re, rewrite)) {
        return result;
    }

    while (!result.empty() && (result.back() == '\n' || result.back() == ' ' || result.back() == '\t')) {
        result.pop_back();
    }
    return result.empty() ? line : result + "\n\n" + line;
}
