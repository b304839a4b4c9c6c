// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/prober.hpp>
#include <grab/core/mime_types.hpp>
#include <charconv>
#include <regex>
#include <tuple>

namespace grab::core {

namespace {

// Content-Length, 0 when absent or not a plain decimal number
std::uint64_t parse_content_length(std::string_view value) noexcept {
    std::uint64_t size = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), size);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return 0;
    }
    return size;
}

} // namespace

std::expected<ProbeResult, RequestFailure> CapabilityProber::probe(const std::string& url) noexcept {
    try {
        auto response = client_.head(url);

        // Some servers reject HEAD; ask again with a plain GET
        if (!response || !response->is_success()) {
            response = client_.get_headers(url);
            if (!response) {
                return std::unexpected(RequestFailure{response.error(), 0});
            }
        }

        if (response->status_code >= 400) {
            return std::unexpected(RequestFailure{status_error(response->status_code),
                                                  response->status_code});
        }

        ProbeResult result;
        Transfer& transfer = result.transfer;
        transfer.url = url;

        std::string file_ext;
        auto filename = parse_content_disposition(response->header("Content-Disposition"));
        if (!filename.empty()) {
            std::tie(transfer.name, file_ext) = split_last_dot(filename);
            if (transfer.name.empty() || transfer.name == "." || transfer.name == "..") {
                transfer.name = DEFAULT_FILENAME;
            }
        }

        auto content_type = response->header("Content-Type");
        if (!content_type.empty()) {
            transfer.content_type = std::string(content_type);
            transfer.ext = file_extension(content_type);
        } else {
            transfer.ext = std::move(file_ext);
        }

        transfer.size = parse_content_length(response->header("Content-Length"));

        if (response->header("Accept-Ranges") != "bytes") {
            transfer.accepts_ranges = false;
            result.warning = make_error_code(DownloadErrc::range_not_supported);
        }

        return result;
    } catch (const std::exception&) {
        return std::unexpected(RequestFailure{make_error_code(DownloadErrc::request_failed), 0});
    }
}

std::string CapabilityProber::parse_content_disposition(std::string_view value) {
    static const std::regex quoted(R"re((?:^|[;\s])filename="([^"]+)")re", std::regex::icase);
    static const std::regex bare(R"re((?:^|[;\s])filename=([^";\s]+))re", std::regex::icase);

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(value.begin(), value.end(), match, quoted) &&
        !std::regex_search(value.begin(), value.end(), match, bare)) {
        return {};
    }

    // Only the last path component: the name must stay inside the output directory
    auto name = match[1].str();
    auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name.erase(0, slash + 1);
    }
    if (name == "." || name == "..") {
        return {};
    }
    return name;
}

std::pair<std::string, std::string> CapabilityProber::split_last_dot(std::string_view name) {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos) {
        return {std::string(name), {}};
    }
    return {std::string(name.substr(0, dot)), std::string(name.substr(dot + 1))};
}

} // namespace grab::core
