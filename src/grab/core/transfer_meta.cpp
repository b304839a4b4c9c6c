// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/transfer_meta.hpp>
#include <grab/core/chunk.hpp>
#include <grab/core/config.hpp>
#include <grab/core/error.hpp>
#include <grab/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace grab::core {

// nlohmann/json hooks, found by ADL
void to_json(nlohmann::json& j, const MissedChunk& c) {
    j = nlohmann::json{{"index", c.index}, {"start", c.start}, {"end", c.end}};
}

void from_json(const nlohmann::json& j, MissedChunk& c) {
    j.at("index").get_to(c.index);
    j.at("start").get_to(c.start);
    j.at("end").get_to(c.end);
}

void to_json(nlohmann::json& j, const TransferMeta& m) {
    j = nlohmann::json{
        {"url", m.url},
        {"missed_chunks", m.missed_chunks},
        {"total_size", m.total_size},
        {"downloaded_size", m.downloaded_size},
    };
}

void from_json(const nlohmann::json& j, TransferMeta& m) {
    j.at("url").get_to(m.url);
    if (j.contains("missed_chunks") && !j.at("missed_chunks").is_null()) {
        j.at("missed_chunks").get_to(m.missed_chunks);
    }
    j.at("total_size").get_to(m.total_size);
    j.at("downloaded_size").get_to(m.downloaded_size);
}

MissedChunk to_missed(const Chunk& chunk) noexcept {
    return MissedChunk{chunk.index, chunk.range.start, chunk.range.end};
}

std::string TransferMeta::meta_path(std::string_view output_path) {
    return std::string(output_path) + std::string(META_SUFFIX);
}

std::error_code TransferMeta::save(std::string_view path) const noexcept {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                return make_error_code(disk::DiskErrc::invalid_path);
            }
        }

        std::ofstream file(p, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }

        file << nlohmann::json(*this).dump(2) << '\n';
        if (!file.flush()) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<TransferMeta, std::error_code>
TransferMeta::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::filesystem::path(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        auto j = nlohmann::json::parse(file);
        return j.get<TransferMeta>();
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::metadata_error));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

bool TransferMeta::exists(std::string_view output_path) noexcept {
    try {
        std::error_code ec;
        return std::filesystem::exists(meta_path(output_path), ec);
    } catch (const std::bad_alloc&) {
        return false;
    }
}

void TransferMeta::remove(std::string_view output_path) noexcept {
    try {
        std::error_code ec;
        std::filesystem::remove(meta_path(output_path), ec);
    } catch (const std::bad_alloc&) {
        // Best effort
    }
}

} // namespace grab::core
