// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/mime_types.hpp>
#include <grab/core/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace grab::core {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 50> MIME_TO_EXT{{
    // Images
    {"image/jpeg", "jpg"},
    {"image/png", "png"},
    {"image/gif", "gif"},
    {"image/webp", "webp"},
    {"image/bmp", "bmp"},
    {"image/svg+xml", "svg"},
    {"image/tiff", "tiff"},
    {"image/vnd.microsoft.icon", "ico"},

    // Audio
    {"audio/mpeg", "mp3"},
    {"audio/wav", "wav"},
    {"audio/ogg", "ogg"},
    {"audio/webm", "webm"},
    {"audio/flac", "flac"},

    // Video
    {"video/mp4", "mp4"},
    {"video/x-m4v", "m4v"},
    {"video/webm", "webm"},
    {"video/ogg", "ogv"},
    {"video/x-msvideo", "avi"},
    {"video/mpeg", "mpeg"},

    // Documents
    {"application/pdf", "pdf"},
    {"application/msword", "doc"},
    {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", "docx"},
    {"application/vnd.ms-excel", "xls"},
    {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", "xlsx"},
    {"application/vnd.ms-powerpoint", "ppt"},
    {"application/vnd.openxmlformats-officedocument.presentationml.presentation", "pptx"},

    // Text and code
    {"text/plain", "txt"},
    {"text/html", "html"},
    {"text/css", "css"},
    {"text/csv", "csv"},
    {"text/javascript", "js"},
    {"application/javascript", "js"},
    {"application/json", "json"},
    {"application/xml", "xml"},
    {"text/xml", "xml"},
    {"application/x-yaml", "yaml"},
    {"application/x-sh", "sh"},
    {"application/x-httpd-php", "php"},

    // Archives and executables
    {"application/zip", "zip"},
    {"application/x-rar-compressed", "rar"},
    {"application/x-7z-compressed", "7z"},
    {"application/gzip", "gz"},
    {"application/x-gzip", "gz"},
    {"application/x-tar", "tar"},
    {"application/x-bzip2", "bz2"},
    {"application/x-xz", "xz"},
    {"application/java-archive", "jar"},
    {"application/x-msdownload", "exe"},
    {"application/x-iso9660-image", "iso"},
    {"application/vnd.debian.binary-package", "deb"},
}};

} // namespace

std::string file_extension(std::string_view mime_type) {
    auto semicolon = mime_type.find(';');
    if (semicolon != std::string_view::npos) {
        mime_type = mime_type.substr(0, semicolon);
    }

    while (!mime_type.empty() && std::isspace(static_cast<unsigned char>(mime_type.front()))) {
        mime_type.remove_prefix(1);
    }
    while (!mime_type.empty() && std::isspace(static_cast<unsigned char>(mime_type.back()))) {
        mime_type.remove_suffix(1);
    }

    std::string lower;
    lower.reserve(mime_type.size());
    for (char c : mime_type) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto it = std::find_if(MIME_TO_EXT.begin(), MIME_TO_EXT.end(),
                           [&lower](const auto& entry) { return entry.first == lower; });
    if (it != MIME_TO_EXT.end()) {
        return std::string(it->second);
    }
    return std::string(FALLBACK_EXTENSION);
}

} // namespace grab::core
