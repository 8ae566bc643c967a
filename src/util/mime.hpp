#pragma once

#include <string>

namespace phabstack {

// Guess a MIME type from the file extension of `path` (case-insensitive).
// Unknown extensions give "application/octet-stream".
std::string
guess_mime_type(const std::string& path);

bool
is_image_mime_type(const std::string& mime_type);

}  // namespace phabstack
