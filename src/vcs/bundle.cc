#include "vcs/bundle.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>

using namespace phabstack;

namespace {

const std::string bundle_magic = "HG10UN";

uint32_t
read_u32be(gsl::span<const uint8_t> bytes) {
    return (uint32_t(bytes[0]) << 24) | (uint32_t(bytes[1]) << 16) | (uint32_t(bytes[2]) << 8) | uint32_t(bytes[3]);
}

bool
is_null_hash(gsl::span<const uint8_t> hash) {
    return std::all_of(hash.begin(), hash.end(), [](uint8_t b) { return b == 0; });
}

}  // namespace

std::string
phabstack::to_hex(gsl::span<const uint8_t> bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

bool
phabstack::parse_bundle(gsl::span<const uint8_t> bytes, HashMapping& mapping, Status& status) {
    const size_t size = static_cast<size_t>(bytes.size());
    if (size < bundle_magic.size() ||
        !std::equal(bundle_magic.begin(), bundle_magic.end(), bytes.begin(),
                    [](char c, uint8_t b) { return static_cast<uint8_t>(c) == b; })) {
        return status.set_error(ErrorKind::User, "not an uncompressed HG10 bundle");
    }

    size_t offset = bundle_magic.size();
    size_t chunks = 0;
    for (;;) {
        if (size - offset < 4) {
            return status.set_error(ErrorKind::Integrity,
                                    fmt::format("bundle ends without a terminator at byte {}", offset));
        }

        const size_t length = read_u32be(bytes.subspan(offset, 4));
        if (length <= bundle_chunk_header_size) {
            break;
        }
        if (length > size - offset) {
            return status.set_error(ErrorKind::Integrity,
                                    fmt::format("bundle chunk at byte {} claims {} bytes, {} left", offset, length,
                                                size - offset));
        }

        auto node = bytes.subspan(offset + 4, bundle_hash_size);
        auto parent1 = bytes.subspan(offset + 4 + bundle_hash_size, bundle_hash_size);
        auto parent2 = bytes.subspan(offset + 4 + 2 * bundle_hash_size, bundle_hash_size);
        auto changeset = bytes.subspan(offset + 4 + 3 * bundle_hash_size, bundle_hash_size);

        if (!is_null_hash(parent2)) {
            return status.set_error(ErrorKind::User, fmt::format("changeset {} is a merge, which is not supported",
                                                                 to_hex(node)));
        }
        if (!std::equal(node.begin(), node.end(), changeset.begin())) {
            return status.set_error(ErrorKind::Integrity,
                                    fmt::format("bundle chunk for {} carries changeset {}", to_hex(node),
                                                to_hex(changeset)));
        }

        mapping[to_hex(parent1)] = to_hex(node);
        offset += length;
        chunks++;
    }

    spdlog::debug("bundle: {} changesets", chunks);
    return true;
}

bool
phabstack::read_bundle_file(const std::string& path, std::vector<uint8_t>& bytes, Status& status) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return status.set_error(ErrorKind::Process, fmt::format("could not open bundle '{}'", path));
    }
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return status.set_error(ErrorKind::Process, fmt::format("could not read bundle '{}'", path));
    }
    return true;
}
