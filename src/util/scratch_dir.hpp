#pragma once

#include "util/status.hpp"

#include <filesystem>
#include <string>

namespace phabstack {

// A private temporary directory, removed with everything in it when the
// object goes out of scope.
class ScratchDir {
   public:
    ScratchDir() = default;
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir&
    operator=(const ScratchDir&) = delete;

    bool
    create(const std::string& prefix, Status& status);

    const std::filesystem::path&
    path() const {
        return path_;
    }

   private:
    std::filesystem::path path_;
};

}  // namespace phabstack
