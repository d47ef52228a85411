#include "serve/mime_types.hpp"

#include <cctype>
#include <unordered_map>

namespace staticfs {

namespace {

const std::unordered_map<std::string, std::string>& Table() {
    static const std::unordered_map<std::string, std::string> kTable = {
        {"html", "text/html; charset=utf-8"},
        {"htm", "text/html; charset=utf-8"},
        {"css", "text/css; charset=utf-8"},
        {"js", "application/javascript"},
        {"mjs", "application/javascript"},
        {"json", "application/json"},
        {"map", "application/json"},
        {"txt", "text/plain; charset=utf-8"},
        {"md", "text/markdown; charset=utf-8"},
        {"csv", "text/csv; charset=utf-8"},
        {"xml", "application/xml"},
        {"svg", "image/svg+xml"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"avif", "image/avif"},
        {"ico", "image/x-icon"},
        {"woff", "font/woff"},
        {"woff2", "font/woff2"},
        {"ttf", "font/ttf"},
        {"otf", "font/otf"},
        {"wasm", "application/wasm"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"mp3", "audio/mpeg"},
        {"ogg", "audio/ogg"},
        {"wav", "audio/wav"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
    };
    return kTable;
}

} // namespace

std::string MimeTypeForExtension(std::string_view ext) {
    std::string key(ext);
    for (char& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    auto it = Table().find(key);
    if (it == Table().end()) return "application/octet-stream";
    return it->second;
}

} // namespace staticfs
