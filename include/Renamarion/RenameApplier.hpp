// =================================================================
// include/Renamarion/RenameApplier.hpp
// =================================================================
// Defines the capability that performs a confirmed rename.

#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace Renamarion {

/**
 * @brief Result of one rename attempt
 */
struct ApplyResult {
    bool success = false;
    std::string error_message;   ///< Set when success is false
};

/**
 * @brief Performs the mutation for a confirmed (original, renamed) pair
 *
 * Implementations report failures through ApplyResult and do not throw.
 */
class RenameApplier {
public:
    virtual ~RenameApplier() = default;

    /**
     * @brief Rename one item
     * @param from Existing path
     * @param to Target path (same parent)
     * @return Success flag and, on failure, a message naming the cause
     */
    virtual ApplyResult apply(const std::filesystem::path& from,
                              const std::filesystem::path& to) = 0;

    /**
     * @brief Whether the applier actually modifies the filesystem
     */
    virtual bool isDryRun() const { return false; }
};

/**
 * @brief Renames items on disk with std::filesystem::rename
 *
 * Never overwrites: an existing target is reported as a collision.
 */
class FilesystemRenameApplier : public RenameApplier {
public:
    ApplyResult apply(const std::filesystem::path& from,
                      const std::filesystem::path& to) override;
};

/**
 * @brief Records confirmed renames without touching the filesystem
 */
class DryRunRenameApplier : public RenameApplier {
public:
    ApplyResult apply(const std::filesystem::path& from,
                      const std::filesystem::path& to) override;

    bool isDryRun() const override { return true; }

    const std::vector<std::pair<std::filesystem::path, std::filesystem::path>>& getRecorded() const {
        return m_recorded;
    }

private:
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> m_recorded;
};

} // namespace Renamarion
