#pragma once

#include "util/status.hpp"

#include <string>
#include <vector>

namespace phabstack {

struct ProgramOptions {
    bool help = false;

    std::string log_level = "info";
    std::string ref = "HEAD";
    std::string git_command = "git";
    std::string phabricator_url;
    bool cinnabar = true;

    // Repository to work in; empty means the current directory.
    std::string work_dir;

    std::string command;
    std::vector<std::string> arguments;
};

std::string
config_get_directory();

// Load phabstack.conf from the config directory into `program_options`,
// creating the file with the current defaults when it does not exist.
bool
config_apply_options(ProgramOptions& program_options, Status& status);

}  // namespace phabstack
