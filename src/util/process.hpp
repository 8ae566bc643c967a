#pragma once

#include "util/status.hpp"

#include <string>
#include <utility>
#include <vector>

namespace phabstack {

struct ProcessOptions {
    std::string working_dir;

    // Written to the child's stdin, which is then closed.
    std::string input;

    // Added to the inherited environment.
    std::vector<std::pair<std::string, std::string>> env;

    // A non-zero exit is an error unless this is false.
    bool check = true;
};

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Printable form of an argument vector, quoting where needed.
std::string
command_line(const std::vector<std::string>& argv);

// Run argv[0] from PATH and wait for it, capturing stdout and stderr as bytes.
bool
run_process(const std::vector<std::string>& argv,
            const ProcessOptions& options,
            ProcessResult& result,
            Status& status);

}  // namespace phabstack
