// =================================================================
// include/Renamarion/DirectoryScanner.hpp
// =================================================================
// Header for walking the directory tree under the selected root.

#pragma once

#include "Renamarion/Classifier.hpp"
#include "Renamarion/Inventory.hpp"
#include <filesystem>
#include <functional>
#include <string>

namespace Renamarion {

class ScanProgress;

/**
 * @brief Deterministic top-down walk of a directory tree
 *
 * For each folder the scanner reports its subdirectories, then its files,
 * both sorted by name, and then descends into the subdirectories in the
 * same order. Symbolic links are reported but never followed. Any
 * filesystem error aborts the walk with a ScanError: a partial inventory
 * would produce misleading counts.
 */
class DirectoryScanner {
public:
    /**
     * @brief Callback receiving (parent, name, is_directory) for every item
     */
    using Visitor = std::function<void(const std::filesystem::path& parent,
                                       const std::string& name,
                                       bool is_directory)>;

    /**
     * @brief Construct a new DirectoryScanner
     * @param root_path The root directory to scan from
     */
    explicit DirectoryScanner(const std::filesystem::path& root_path);

    /**
     * @brief Walk the tree and report every item below the root
     * @param visitor Receives each item; the root itself is not reported
     * @param progress Optional indicator, ticked once per folder
     * @throws ScanError on any filesystem error
     */
    void walk(const Visitor& visitor, ScanProgress* progress = nullptr);

    /**
     * @brief Walk the tree and classify every item
     * @param classifier Classifier bound to the frozen rule set
     * @param progress Optional indicator
     * @return Inventory in traversal order
     * @throws ScanError on any filesystem error
     */
    Inventory scan(const Classifier& classifier, ScanProgress* progress = nullptr);

    const std::filesystem::path& getRootPath() const { return m_root_path; }

    /**
     * @brief Number of folders read by the last walk, root included
     */
    size_t getFoldersVisited() const { return m_folders_visited; }

private:
    std::filesystem::path m_root_path;
    size_t m_folders_visited;

    void walkFolder(const std::filesystem::path& folder,
                    const Visitor& visitor,
                    ScanProgress* progress);
};

} // namespace Renamarion
