// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace grab::core {

class Url {
public:
    // Accepts absolute URLs with a scheme and a host
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }

    // The string the URL was parsed from
    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
};

// A URL the downloader can fetch: http or https with a host
[[nodiscard]] bool is_downloadable(std::string_view url_str) noexcept;

} // namespace grab::core
