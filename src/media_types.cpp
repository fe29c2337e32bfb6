#include "gigvault/media_types.hpp"
#include "gigvault/http.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace gigvault {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

const std::unordered_map<std::string, std::string>& extension_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {"mp4", "video/mp4"},
        {"m4v", "video/x-m4v"},
        {"mov", "video/quicktime"},
        {"webm", "video/webm"},
        {"mkv", "video/x-matroska"},
        {"m4a", "audio/m4a"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"aac", "audio/aac"},
        {"flac", "audio/flac"},
        {"ogg", "audio/ogg"},
    };
    return table;
}

}  // namespace

std::string guess_mime_type(const std::string& name) {
    // Ignore any query or fragment when given a URL path
    std::string path = name.substr(0, name.find_first_of("?#"));
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }

    auto it = extension_table().find(to_lower(path.substr(dot + 1)));
    if (it == extension_table().end()) {
        return "application/octet-stream";
    }
    return it->second;
}

std::string normalize_mime_type(const std::string& content_type) {
    std::string base = content_type.substr(0, content_type.find(';'));
    return to_lower(trim(base));
}

}  // namespace gigvault
