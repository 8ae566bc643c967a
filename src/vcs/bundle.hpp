#pragma once

/*
    Reader for the changelog part of an uncompressed Mercurial HG10 bundle.

        "HG10UN"
        repeat:
            u32be length      including this 84-byte header
            node      [20]
            parent1   [20]
            parent2   [20]    all zero, merges are not supported
            changeset [20]    equal to node
            payload   [length - 84]

    A length of 84 or less ends the stream, so a chunk without payload is
    read as the end of the stream too.
*/

#include "util/status.hpp"

#include <gsl/span>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace phabstack {

// Parent hash -> child hash, both lower-case hex.
using HashMapping = std::map<std::string, std::string>;

constexpr size_t bundle_hash_size = 20;
constexpr size_t bundle_chunk_header_size = 4 + 4 * bundle_hash_size;

std::string
to_hex(gsl::span<const uint8_t> bytes);

bool
parse_bundle(gsl::span<const uint8_t> bytes, HashMapping& mapping, Status& status);

bool
read_bundle_file(const std::string& path, std::vector<uint8_t>& bytes, Status& status);

}  // namespace phabstack
