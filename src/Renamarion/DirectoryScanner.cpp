// =================================================================
// src/Renamarion/DirectoryScanner.cpp
// =================================================================
// Implementation for directory tree traversal.

#include "Renamarion/DirectoryScanner.hpp"
#include "Renamarion/Errors.hpp"
#include "Renamarion/Logger.hpp"
#include "Renamarion/ScanProgress.hpp"
#include <algorithm>
#include <system_error>
#include <vector>

namespace Renamarion {

namespace fs = std::filesystem;

namespace {

struct ChildItem {
    std::string name;
    bool is_directory;
    bool is_symlink;
};

} // namespace

DirectoryScanner::DirectoryScanner(const fs::path& root_path)
    : m_root_path(root_path), m_folders_visited(0) {}

void DirectoryScanner::walk(const Visitor& visitor, ScanProgress* progress) {
    m_folders_visited = 0;

    std::error_code ec;
    fs::file_status root_status = fs::status(m_root_path, ec);
    if (ec) {
        throw ScanError(m_root_path.string(), ec.message());
    }
    if (!fs::is_directory(root_status)) {
        throw ScanError(m_root_path.string(), "not a directory");
    }

    LOG_INFO("DirectoryScanner", "Scanning " + m_root_path.string());
    walkFolder(m_root_path, visitor, progress);

    if (progress != nullptr) {
        progress->finish();
    }
}

Inventory DirectoryScanner::scan(const Classifier& classifier, ScanProgress* progress) {
    Inventory inventory;
    walk([&inventory, &classifier](const fs::path& parent, const std::string& name, bool is_directory) {
        inventory.add(classifier.classifyEntry(parent, name,
                                               is_directory ? EntryType::DIRECTORY : EntryType::FILE));
    }, progress);

    Logger::getInstance().logScanSummary(inventory.fileCount(), inventory.directoryCount(),
                                         inventory.problematicFileCount(),
                                         inventory.problematicDirectoryCount());
    return inventory;
}

void DirectoryScanner::walkFolder(const fs::path& folder,
                                  const Visitor& visitor,
                                  ScanProgress* progress) {
    std::error_code ec;
    fs::directory_iterator it(folder, ec);
    if (ec) {
        throw ScanError(folder.string(), ec.message());
    }
    m_folders_visited++;

    std::vector<ChildItem> children;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw ScanError(folder.string(), ec.message());
        }

        ChildItem child;
        child.name = it->path().filename().string();

        child.is_symlink = it->is_symlink(ec);
        if (ec) {
            throw ScanError(it->path().string(), ec.message());
        }

        if (child.is_symlink) {
            // A link is classified by its target. A dangling or looping
            // link has no usable target and is reported as a file.
            fs::file_status target = fs::status(it->path(), ec);
            if (ec) {
                LOG_DEBUG("DirectoryScanner", "Unresolvable link " + it->path().string() + ": " + ec.message());
                ec.clear();
                child.is_directory = false;
            } else {
                child.is_directory = fs::is_directory(target);
            }
        } else {
            child.is_directory = it->is_directory(ec);
            if (ec) {
                throw ScanError(it->path().string(), ec.message());
            }
        }
        children.push_back(std::move(child));
    }
    if (ec) {
        throw ScanError(folder.string(), ec.message());
    }

    std::sort(children.begin(), children.end(),
              [](const ChildItem& a, const ChildItem& b) { return a.name < b.name; });

    for (const auto& child : children) {
        if (child.is_directory) {
            visitor(folder, child.name, true);
        }
    }
    for (const auto& child : children) {
        if (!child.is_directory) {
            visitor(folder, child.name, false);
        }
    }

    if (progress != nullptr) {
        progress->tick();
    }

    for (const auto& child : children) {
        if (child.is_directory && !child.is_symlink) {
            walkFolder(folder / child.name, visitor, progress);
        }
    }
}

} // namespace Renamarion
