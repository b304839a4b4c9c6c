// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <array>
#include <string>
#include <string_view>

namespace grab::disk {

// Directory names probed under the home directory, in order
constexpr std::array<std::string_view, 4> DOWNLOAD_DIR_NAMES{"Downloads", "downloads", "download", "Pobrane"};

// First existing download directory under the user's home, else the home
// directory itself, else "."
[[nodiscard]] std::string downloads_dir();

// Same lookup under an explicit home directory
[[nodiscard]] std::string downloads_dir(std::string_view home);

// <dir>/<file_name>, without doubling a trailing separator
[[nodiscard]] std::string join_path(std::string_view dir, std::string_view file_name);

} // namespace grab::disk
