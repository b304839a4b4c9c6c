// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/core/chunk.hpp>
#include <grab/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace grab::core {

// Status line and headers of a response. Header names are lower-case.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;

    // Header value by case-insensitive name, empty if absent
    [[nodiscard]] std::string_view header(std::string_view name) const noexcept;

    [[nodiscard]] bool is_success() const noexcept { return status_code >= 200 && status_code < 300; }
};

// Receives body bytes; return false to abort the transfer
using BodySink = std::function<bool(const std::byte* data, std::size_t size)>;

using HttpResult = std::expected<HttpResponse, std::error_code>;

// Transport seam. Implementations report transport failures as errors and
// return every HTTP status as a response; bodies of responses with status
// >= 400 are never passed to the sink.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // HEAD request
    [[nodiscard]] virtual HttpResult head(const std::string& url) noexcept = 0;

    // GET request that stops once the headers have arrived
    [[nodiscard]] virtual HttpResult get_headers(const std::string& url) noexcept = 0;

    // GET request, optionally limited to a byte range
    [[nodiscard]] virtual HttpResult get(const std::string& url,
                                         const BodySink& sink,
                                         std::optional<ByteRange> range = std::nullopt) noexcept = 0;
};

// libcurl-backed client, safe to share between worker threads
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient() = default;

    [[nodiscard]] HttpResult head(const std::string& url) noexcept override;
    [[nodiscard]] HttpResult get_headers(const std::string& url) noexcept override;
    [[nodiscard]] HttpResult get(const std::string& url,
                                 const BodySink& sink,
                                 std::optional<ByteRange> range = std::nullopt) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

// Lower-case a header name
[[nodiscard]] std::string lower_header_name(std::string_view name);

// Apply one raw header line to response. A status line clears the headers
// collected so far. Returns false only when out of memory.
[[nodiscard]] bool add_header_line(HttpResponse& response, std::string_view line) noexcept;

} // namespace grab::core
