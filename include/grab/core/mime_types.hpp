// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <string_view>

namespace grab::core {

// File extension (without the dot) for a Content-Type value.
// Parameters such as "; charset=utf-8" are ignored; unknown types give "bin".
[[nodiscard]] std::string file_extension(std::string_view mime_type);

} // namespace grab::core
