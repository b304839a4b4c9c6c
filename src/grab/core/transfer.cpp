// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/transfer.hpp>

namespace grab::core {

std::string Transfer::file_name() const {
    return ext.empty() ? name : name + "." + ext;
}

} // namespace grab::core
