#include "util/mime.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace {

// clang-format off
const std::unordered_map<std::string, std::string> mime_types = {
    {"png",   "image/png"},
    {"jpg",   "image/jpeg"},
    {"jpeg",  "image/jpeg"},
    {"gif",   "image/gif"},
    {"bmp",   "image/bmp"},
    {"ico",   "image/vnd.microsoft.icon"},
    {"svg",   "image/svg+xml"},
    {"tif",   "image/tiff"},
    {"tiff",  "image/tiff"},
    {"webp",  "image/webp"},
    {"pnm",   "image/x-portable-anymap"},
    {"icns",  "image/icns"},
    {"pdf",   "application/pdf"},
    {"zip",   "application/zip"},
    {"gz",    "application/gzip"},
    {"tar",   "application/x-tar"},
    {"jar",   "application/java-archive"},
    {"wasm",  "application/wasm"},
    {"json",  "application/json"},
    {"js",    "text/javascript"},
    {"mjs",   "text/javascript"},
    {"css",   "text/css"},
    {"html",  "text/html"},
    {"htm",   "text/html"},
    {"txt",   "text/plain"},
    {"xml",   "text/xml"},
    {"woff",  "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf",   "font/ttf"},
    {"otf",   "font/otf"},
    {"mp3",   "audio/mpeg"},
    {"ogg",   "audio/ogg"},
    {"wav",   "audio/x-wav"},
    {"mp4",   "video/mp4"},
    {"webm",  "video/webm"},
};
// clang-format on

}  // namespace

std::string
phabstack::guess_mime_type(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(0, 1);
    }
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (auto it = mime_types.find(extension); it != mime_types.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

bool
phabstack::is_image_mime_type(const std::string& mime_type) {
    return mime_type.rfind("image/", 0) == 0;
}
