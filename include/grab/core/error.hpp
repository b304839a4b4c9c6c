// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace grab::core {

enum class DownloadErrc {
    success = 0,
    request_failed,
    network_error,
    not_found,
    permission_denied,
    server_error,
    range_not_supported,
    invalid_range,
    chunk_missed,
    empty_body,
    invalid_url,
    metadata_error,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "grab::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:             return "Success";
            case DownloadErrc::request_failed:      return "Request failed";
            case DownloadErrc::network_error:       return "Network error";
            case DownloadErrc::not_found:           return "Resource not found (404)";
            case DownloadErrc::permission_denied:   return "Permission denied (401/403)";
            case DownloadErrc::server_error:        return "Server error (5xx)";
            case DownloadErrc::range_not_supported: return "Range not supported, chunked download disabled";
            case DownloadErrc::invalid_range:       return "Invalid byte range";
            case DownloadErrc::chunk_missed:        return "Chunk still empty after all retries";
            case DownloadErrc::empty_body:          return "Server sent an empty body";
            case DownloadErrc::invalid_url:         return "Invalid URL";
            case DownloadErrc::metadata_error:      return "Malformed metadata";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Map an HTTP status >= 400 to a download error (empty below 400)
inline std::error_code status_error(std::int32_t status_code) noexcept {
    if (status_code < 400) return {};
    if (status_code == 404) return make_error_code(DownloadErrc::not_found);
    if (status_code == 401 || status_code == 403) return make_error_code(DownloadErrc::permission_denied);
    if (status_code == 416) return make_error_code(DownloadErrc::invalid_range);
    if (status_code >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::request_failed);
}

} // namespace grab::core

namespace std {

template<>
struct is_error_code_enum<grab::core::DownloadErrc> : true_type {};

} // namespace std
