#pragma once

#include <string>

namespace gigvault {

/// MIME type for a file name or URL path, from its extension.
/// Unknown extensions map to application/octet-stream.
std::string guess_mime_type(const std::string& name);

/// "Video/MP4; codecs=..." -> "video/mp4". Empty input stays empty.
std::string normalize_mime_type(const std::string& content_type);

}  // namespace gigvault
