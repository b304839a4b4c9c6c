// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace grab::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    for (std::size_t i = 0; i < scheme_end; ++i) {
        auto c = static_cast<unsigned char>(url_str[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.scheme_ += static_cast<char>(std::tolower(c));
    }

    auto rest_start = scheme_end + 3;

    auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
    auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
    auto fragment_start = std::min(url_str.find('#', rest_start), url_str.length());

    // Authority ends at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start});

    // Skip user:pass@
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    url.str_ = std::string(url_str);
    return url;
}

bool is_downloadable(std::string_view url_str) noexcept {
    auto url = Url::parse(url_str);
    return url && url->is_http();
}

} // namespace grab::core
