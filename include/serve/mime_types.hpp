#pragma once

#include <string>
#include <string_view>

namespace staticfs {

// Content type for a file extension given without the dot, matched
// case-insensitively. Unknown extensions map to application/octet-stream.
std::string MimeTypeForExtension(std::string_view ext);

} // namespace staticfs
