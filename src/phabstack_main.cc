#include "config/config.hpp"
#include "output/wire.hpp"
#include "processing/raw_change_parser.hpp"
#include "review/commit_message.hpp"
#include "util/log.hpp"
#include "util/status.hpp"
#include "vcs/commit_graph.hpp"
#include "vcs/git_backend.hpp"
#include "vcs/hash_crosswalk.hpp"
#include "vcs/rewrite.hpp"
#include "vcs/session.hpp"

#include <getopt.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

#ifndef PHABSTACK_VERSION
#define PHABSTACK_VERSION "unknown"
#endif

namespace phabstack {

namespace {

void
print_json(const nlohmann::json& value) {
    // File contents are not guaranteed to be UTF-8.
    fmt::print("{}\n", value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

bool
command_changes(Session& session, const ProgramOptions& opts, Status& status) {
    if (opts.arguments.size() > 1) {
        return status.set_error(ErrorKind::User, "usage: changes [rev]");
    }
    const std::string rev = opts.arguments.empty() ? opts.ref : opts.arguments[0];

    std::string hash;
    CommitNode commit;
    if (!session.resolve(rev, hash, status) || !session.commit(hash, commit, status)) {
        return false;
    }
    if (opts.cinnabar && !session.secondary_hash(hash, commit.secondary_hash, status)) {
        return false;
    }

    ChangeSet changes;
    nlohmann::json payload;
    if (!build_change_set(session.backend(), commit, changes, status) || !check_uploads(changes, status) ||
        !to_wire_changes(changes, commit, payload, status)) {
        return false;
    }
    print_json(payload);
    return true;
}

bool
command_range(Session& session, const ProgramOptions& opts, Status& status) {
    if (opts.arguments.size() != 1) {
        return status.set_error(ErrorKind::User, "usage: range <revspec>");
    }

    RangeResult range;
    if (!resolve_range(session, opts.ref, opts.arguments[0], range, status)) {
        return false;
    }
    for (const auto& commit : range.push) {
        fmt::print("push     {} {}\n", commit.short_hash(), commit.title);
    }
    for (const auto& commit : range.reparent) {
        fmt::print("reparent {} {}\n", commit.short_hash(), commit.title);
    }
    return true;
}

bool
command_hashes(Session& session, const ProgramOptions& opts, Status& status) {
    if (opts.arguments.size() != 1) {
        return status.set_error(ErrorKind::User, "usage: hashes <revspec>");
    }

    RangeResult range;
    if (!resolve_range(session, opts.ref, opts.arguments[0], range, status) ||
        !ensure_secondary_hashes(session, range.push, status)) {
        return false;
    }
    for (const auto& commit : range.push) {
        fmt::print("{} {}\n", commit.hash, commit.secondary_hash.value_or(""));
    }
    return true;
}

bool
command_diff(Session& session, const ProgramOptions& opts, Status& status) {
    if (opts.arguments.size() != 1) {
        return status.set_error(ErrorKind::User, "usage: diff <revspec>");
    }

    RangeResult range;
    if (!resolve_range(session, opts.ref, opts.arguments[0], range, status) ||
        !ensure_secondary_hashes(session, range.push, status)) {
        return false;
    }

    std::optional<std::string> base;
    if (!session.secondary_hash(range.start, base, status)) {
        return false;
    }

    nlohmann::json diffs = nlohmann::json::array();
    for (const auto& commit : range.push) {
        ChangeSet changes;
        nlohmann::json payload;
        if (!build_change_set(session.backend(), commit, changes, status) || !check_uploads(changes, status) ||
            !to_diff_payload(changes, commit, base.value_or(""), payload, status)) {
            return false;
        }
        diffs.push_back(nlohmann::json{{"commit", commit.hash}, {"title", commit.title}, {"diff", payload}});
        base = commit.secondary_hash;
    }
    print_json(diffs);
    return true;
}

bool
command_link(Session& session, const ProgramOptions& opts, Status& status) {
    if (opts.arguments.size() < 2) {
        return status.set_error(ErrorKind::User, "usage: link <revspec> <revision-id>...");
    }
    if (opts.phabricator_url.empty()) {
        return status.set_error(ErrorKind::User, "phabricator.url is not configured");
    }

    RangeResult range;
    if (!resolve_range(session, opts.ref, opts.arguments[0], range, status)) {
        return false;
    }
    if (range.push.size() != opts.arguments.size() - 1) {
        return status.set_error(ErrorKind::User, fmt::format("{} commits in range but {} revision ids given",
                                                             range.push.size(), opts.arguments.size() - 1));
    }

    std::map<std::string, std::string> messages;
    for (size_t i = 0; i < range.push.size(); i++) {
        std::string id = opts.arguments[i + 1];
        if (!id.empty() && (id[0] == 'D' || id[0] == 'd')) {
            id.erase(0, 1);
        }
        const auto& commit = range.push[i];
        messages[commit.hash] = with_revision_link(commit.message, revision_link(opts.phabricator_url, id));
    }

    RewriteResult result;
    if (!rewrite_stack(session, range, messages, opts.ref, result, status)) {
        return false;
    }
    for (const auto& [old_hash, new_hash] : result.replaced) {
        fmt::print("{} -> {}\n", old_hash, new_hash);
    }
    return true;
}

}  // namespace

}  // namespace phabstack

int
main(int argc, char* argv[]) {
    phabstack::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] <command> [arguments]

Prepare a linear stack of git commits for review

Commands:
    changes [rev]              print the review changes of one commit (default: the ref)
    range <revspec>            list the commits to push and to re-parent
    hashes <revspec>           print the Mercurial hash of every commit to push
    diff <revspec>             print the diff requests of every commit to push
    link <revspec> <id>...     add revision links to the commit messages, one id per commit

    <revspec> is A..B, A.. (up to the ref) or a single commit C (C^..C).

Options:
    -C, --directory [dir]      run in this repository
    -r, --ref [ref]            ref whose history is used (default: HEAD)
    -l, --log-level [level]    trace, debug, info, warn, error or off
    -h, --help                 show this help and exit
    -v, --version              show program version and exit
)",
                                       argv[0]);

        help += "\nConfig directory:\n    " + phabstack::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message + "\n";
        }
        fputs(help.c_str(), optional_error_message.empty() ? stdout : stderr);
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"directory", required_argument, 0, 'C'},
                                               {"ref", required_argument, 0, 'r'},
                                               {"log-level", required_argument, 0, 'l'},
                                               {"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "+C:r:l:hv", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", PHABSTACK_VERSION);
                    exit(0);
                case 'h':
                    opts.help = true;
                    return true;
                case 'C':
                    opts.work_dir = optarg;
                    break;
                case 'r':
                    opts.ref = optarg;
                    break;
                case 'l':
                    opts.log_level = optarg;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        if (optind >= in_argc) {
            show_help("error: missing command");
            return false;
        }

        opts.command = in_argv[optind];
        for (int i = optind + 1; i < in_argc; i++) {
            opts.arguments.emplace_back(in_argv[i]);
        }
        return true;
    };

    // Load the defaults before command line arguments override them
    phabstack::Status status;
    if (!phabstack::config_apply_options(opts, status)) {
        fmt::print(stderr, "error: {}\n", status.error);
        return 1;
    }

    if (!parse_args(argc, argv)) {
        return 2;
    }

    if (opts.help) {
        show_help("");
        return 0;
    }

    if (!phabstack::log_setup(opts.log_level, status)) {
        fmt::print(stderr, "error: {}\n", status.error);
        return 2;
    }

    // A backend command that exits early must not kill us while we write its input.
    signal(SIGPIPE, SIG_IGN);

    phabstack::GitBackend backend(opts.git_command, opts.work_dir, opts.cinnabar);
    phabstack::Session session(backend);

    using Command = bool (*)(phabstack::Session&, const phabstack::ProgramOptions&, phabstack::Status&);
    const std::map<std::string, Command> commands = {
        {"changes", phabstack::command_changes}, {"range", phabstack::command_range},
        {"hashes", phabstack::command_hashes},   {"diff", phabstack::command_diff},
        {"link", phabstack::command_link},
    };

    auto command = commands.find(opts.command);
    if (command == commands.end()) {
        show_help(fmt::format("error: unknown command '{}'", opts.command));
        return 2;
    }

    if (!command->second(session, opts, status)) {
        spdlog::debug("{} error", phabstack::repr(status.kind));
        fmt::print(stderr, "error: {}\n", status.error);
        return 1;
    }
    return 0;
}
