#include "util/process.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <initializer_list>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace phabstack;

namespace {

void
close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Read what is available; closes the descriptor on end of file or error.
void
drain(int& fd, std::string& sink) {
    char buffer[65536];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
    } else if (n == 0 || errno != EINTR) {
        close_fd(fd);
    }
}

std::string
right_trim(const std::string& s) {
    auto end = s.find_last_not_of(" \n\r\t");
    return end == std::string::npos ? std::string{} : s.substr(0, end + 1);
}

}  // namespace

std::string
phabstack::command_line(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (!arg.empty() && arg.find_first_of(" \t\n'\"\\$`*?") == std::string::npos) {
            line += arg;
            continue;
        }
        line += '\'';
        for (char c : arg) {
            if (c == '\'') {
                line += "'\\''";
            } else {
                line += c;
            }
        }
        line += '\'';
    }
    return line;
}

bool
phabstack::run_process(const std::vector<std::string>& argv,
                       const ProcessOptions& options,
                       ProcessResult& result,
                       Status& status) {
    result = ProcessResult{};
    const std::string cmdline = command_line(argv);
    if (argv.empty()) {
        return status.set_error(ErrorKind::Internal, "empty command line");
    }
    spdlog::debug("running: {}", cmdline);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    // The write end of stdin is non-blocking: a blocking write could wait on a
    // child that is itself waiting for us to drain its output.
    if (pipe(in_pipe) < 0 || pipe(out_pipe) < 0 || pipe(err_pipe) < 0 ||
        fcntl(in_pipe[1], F_SETFL, O_NONBLOCK) < 0) {
        int error = errno;
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return status.set_error(ErrorKind::Process, fmt::format("{}: pipe: {}", cmdline, std::strerror(error)));
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        int error = errno;
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return status.set_error(ErrorKind::Process, fmt::format("{}: fork: {}", cmdline, std::strerror(error)));
    }

    if (pid == 0) {
        // Child process
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close(p[0]);
            close(p[1]);
        }

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            _exit(127);
        }
        for (const auto& [key, value] : options.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        execvp(args[0], args.data());
        _exit(127);
    }

    // Parent process
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    size_t written = 0;
    if (options.input.empty()) {
        close_fd(in_fd);
    }

    while (in_fd >= 0 || out_fd >= 0 || err_fd >= 0) {
        pollfd fds[3];
        nfds_t count = 0;
        int in_slot = -1, out_slot = -1, err_slot = -1;
        if (in_fd >= 0) {
            in_slot = static_cast<int>(count);
            fds[count++] = {in_fd, POLLOUT, 0};
        }
        if (out_fd >= 0) {
            out_slot = static_cast<int>(count);
            fds[count++] = {out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            err_slot = static_cast<int>(count);
            fds[count++] = {err_fd, POLLIN, 0};
        }

        if (poll(fds, count, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        if (in_slot >= 0 && fds[in_slot].revents != 0) {
            if (fds[in_slot].revents & POLLOUT) {
                ssize_t n = write(in_fd, options.input.data() + written, options.input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                }
                if ((n < 0 && errno != EINTR && errno != EAGAIN) || written == options.input.size()) {
                    close_fd(in_fd);
                }
            } else {
                // The child closed its stdin early.
                close_fd(in_fd);
            }
        }
        if (out_slot >= 0 && fds[out_slot].revents != 0) {
            drain(out_fd, result.out);
        }
        if (err_slot >= 0 && fds[err_slot].revents != 0) {
            drain(err_fd, result.err);
        }
    }
    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    int wait_status = 0;
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            return status.set_error(ErrorKind::Process,
                                    fmt::format("{}: waitpid: {}", cmdline, std::strerror(errno)));
        }
    }

    if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.exit_code = 128 + WTERMSIG(wait_status);
    }

    if (options.check && result.exit_code != 0) {
        std::string detail = right_trim(result.err);
        if (result.exit_code == 127 && detail.empty()) {
            detail = "command not found";
        }
        return status.set_error(ErrorKind::Process, fmt::format("command failed with exit code {}: {}{}{}",
                                                                result.exit_code, cmdline,
                                                                detail.empty() ? "" : "\n", detail));
    }

    return true;
}
