// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/core/error.hpp>
#include <grab/core/http_client.hpp>
#include <grab/core/transfer.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace grab::core {

// Hard probe failure: no usable Transfer
struct RequestFailure {
    std::error_code error;
    std::int32_t status_code{0};  // 0 for transport errors
};

// Probe outcome. `warning` is empty or DownloadErrc::range_not_supported;
// the transfer is usable either way.
struct ProbeResult {
    Transfer transfer;
    std::error_code warning;
};

// Learns size, filename, content type and range support of a resource
class CapabilityProber {
public:
    explicit CapabilityProber(HttpClient& client) noexcept : client_(client) {}

    [[nodiscard]] std::expected<ProbeResult, RequestFailure> probe(const std::string& url) noexcept;

    // filename from a Content-Disposition value, empty if none
    [[nodiscard]] static std::string parse_content_disposition(std::string_view value);

    // Split at the last dot: "archive.tar.gz" -> {"archive.tar", "gz"}
    [[nodiscard]] static std::pair<std::string, std::string> split_last_dot(std::string_view name);

private:
    HttpClient& client_;
};

} // namespace grab::core
