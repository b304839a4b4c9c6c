// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/http_client.hpp>
#include <grab/core/config.hpp>
#include <curl/curl.h>
#include <cctype>
#include <new>
#include <string>

namespace grab::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list cleanup
struct CurlHeaders {
    curl_slist* list = nullptr;

    ~CurlHeaders() { if (list) curl_slist_free_all(list); }
};

// Per-request state shared with the callbacks
struct RequestContext {
    CURL* curl{nullptr};
    HttpResponse* response{nullptr};
    const BodySink* sink{nullptr};
    bool headers_only{false};
    bool stopped{false};  // Write callback ended the transfer on purpose
};

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<RequestContext*>(userdata);
    if (!ctx || !ctx->response) return total;

    // 0 aborts the transfer with CURLE_WRITE_ERROR
    return add_header_line(*ctx->response, std::string_view(buffer, total)) ? total : 0;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    std::size_t total = size * nmemb;
    auto* ctx = static_cast<RequestContext*>(userdata);
    if (!ctx) return 0;

    if (ctx->headers_only) {
        ctx->stopped = true;
        return 0;
    }

    // Error pages never reach the sink
    long http_code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        return total;
    }

    if (ctx->sink && *ctx->sink) {
        if (!(*ctx->sink)(reinterpret_cast<const std::byte*>(ptr), total)) {
            ctx->stopped = true;
            return 0;
        }
    }
    return total;
}

void apply_common_options(CURL* curl, const std::string& url, RequestContext& ctx) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Required for use from worker threads

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
}

std::error_code curl_error_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                 return {};
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
                                       return make_error_code(DownloadErrc::invalid_url);
        case CURLE_RANGE_ERROR:        return make_error_code(DownloadErrc::invalid_range);
        default:                       return make_error_code(DownloadErrc::network_error);
    }
}

// Run a configured request and fill in the status code
HttpResult perform(CURL* curl, RequestContext& ctx, HttpResponse& response) noexcept {
    CURLcode result = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    // Stopping from the write callback surfaces as a write error
    if (result == CURLE_WRITE_ERROR && ctx.stopped) {
        return response;
    }

    if (result != CURLE_OK) {
        return std::unexpected(curl_error_to_error_code(result));
    }
    return response;
}

} // namespace

std::string_view HttpResponse::header(std::string_view name) const noexcept {
    try {
        auto it = headers.find(lower_header_name(name));
        if (it == headers.end()) return {};
        return it->second;
    } catch (const std::bad_alloc&) {
        return {};
    }
}

bool add_header_line(HttpResponse& response, std::string_view line) noexcept {
    // A new status line starts a new response (redirects, 100 Continue)
    if (line.starts_with("HTTP/")) {
        response.headers.clear();
        return true;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return true;

    auto name = line.substr(0, colon);
    auto value = line.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    // Runs inside a libcurl callback; nothing may propagate
    try {
        response.headers[lower_header_name(name)] = std::string(value);
    } catch (const std::bad_alloc&) {
        return false;
    }
    return true;
}

std::string lower_header_name(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

//=============================================================================
// CurlHttpClient
//=============================================================================

HttpResult CurlHttpClient::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    RequestContext ctx{curl.ptr, &response, nullptr, false, false};

    apply_common_options(curl.ptr, url, ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    return perform(curl.ptr, ctx, response);
}

HttpResult CurlHttpClient::get_headers(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    RequestContext ctx{curl.ptr, &response, nullptr, true, false};

    apply_common_options(curl.ptr, url, ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);

    return perform(curl.ptr, ctx, response);
}

HttpResult CurlHttpClient::get(const std::string& url,
                               const BodySink& sink,
                               std::optional<ByteRange> range) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    RequestContext ctx{curl.ptr, &response, &sink, false, false};

    apply_common_options(curl.ptr, url, ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);

    // Explicit header rather than CURLOPT_RANGE so the exact form is on the wire
    CurlHeaders headers;
    std::string range_header;
    if (range) {
        range_header = "Range: bytes=" + range->to_string();
        headers.list = curl_slist_append(headers.list, range_header.c_str());
        if (!headers.list) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
    }

    return perform(curl.ptr, ctx, response);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlHttpClient::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlHttpClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace grab::core
