#include "util/scratch_dir.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

phabstack::ScratchDir::~ScratchDir() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("could not remove scratch directory '{}': {}", path_.string(), ec.message());
    }
}

bool
phabstack::ScratchDir::create(const std::string& prefix, Status& status) {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return status.set_error(ErrorKind::Process, fmt::format("no temporary directory: {}", ec.message()));
    }

    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return status.set_error(ErrorKind::Process,
                                fmt::format("mkdtemp '{}': {}", pattern, std::strerror(errno)));
    }

    path_ = buffer.data();
    return true;
}
