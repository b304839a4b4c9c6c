// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/disk/paths.hpp>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace grab::disk {

namespace fs = std::filesystem;

std::string downloads_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home || *home == '\0') {
        return ".";
    }
    return downloads_dir(home);
}

std::string downloads_dir(std::string_view home) {
    for (auto name : DOWNLOAD_DIR_NAMES) {
        fs::path dir = fs::path(home) / name;
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            return dir.string();
        }
    }
    return std::string(home);
}

std::string join_path(std::string_view dir, std::string_view file_name) {
    while (dir.size() > 1 && (dir.back() == '/' || dir.back() == '\\')) {
        dir.remove_suffix(1);
    }
    if (dir.empty()) {
        return std::string(file_name);
    }
    if (dir == "/") {
        return "/" + std::string(file_name);
    }
    return std::string(dir) + "/" + std::string(file_name);
}

} // namespace grab::disk
