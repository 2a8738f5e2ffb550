// =================================================================
// include/Renamarion/Entry.hpp
// =================================================================
// A scanned filesystem item and its classification outcome.

#pragma once

#include "Renamarion/Rule.hpp"
#include <filesystem>
#include <string>

namespace Renamarion {

/**
 * @brief Kind of filesystem item
 */
enum class EntryType {
    FILE,       ///< Regular file, or anything that is not a directory
    DIRECTORY   ///< Directory
};

/**
 * @brief One scanned item
 */
struct Entry {
    EntryType type = EntryType::FILE;
    std::filesystem::path path;   ///< Original path (parent / name)
    bool invalid = false;
    RuleKeySet violated;          ///< Empty iff !invalid

    std::string getName() const { return path.filename().string(); }
};

/**
 * @brief Lowercase name of the entry type ("file" or "directory")
 */
inline std::string entryTypeName(EntryType type) {
    return type == EntryType::DIRECTORY ? "directory" : "file";
}

} // namespace Renamarion
