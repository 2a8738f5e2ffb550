// =================================================================
// src/Renamarion/RenameApplier.cpp
// =================================================================
// Implementation for the rename capabilities.

#include "Renamarion/RenameApplier.hpp"
#include <system_error>

namespace Renamarion {

namespace fs = std::filesystem;

ApplyResult FilesystemRenameApplier::apply(const fs::path& from, const fs::path& to) {
    ApplyResult result;
    std::error_code ec;

    fs::file_status source = fs::symlink_status(from, ec);
    if (ec || !fs::exists(source)) {
        result.error_message = "'" + from.string() + "' no longer exists";
        return result;
    }

    if (from == to) {
        result.success = true;
        return result;
    }

    fs::file_status target = fs::symlink_status(to, ec);
    if (!ec && fs::exists(target)) {
        result.error_message = "'" + to.string() + "' already exists";
        return result;
    }

    ec.clear();
    fs::rename(from, to, ec);
    if (ec) {
        result.error_message = "Cannot rename '" + from.string() + "' to '" +
                               to.string() + "': " + ec.message();
        return result;
    }

    result.success = true;
    return result;
}

ApplyResult DryRunRenameApplier::apply(const fs::path& from, const fs::path& to) {
    m_recorded.emplace_back(from, to);
    ApplyResult result;
    result.success = true;
    return result;
}

} // namespace Renamarion
