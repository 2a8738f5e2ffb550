// =================================================================
// include/Renamarion/Inventory.hpp
// =================================================================
// Collects classified entries and groups them by the exact combination
// of rules they violate.

#pragma once

#include "Renamarion/Entry.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace Renamarion {

/**
 * @brief Entries sharing an identical violated-rule set
 */
struct ProblemGroup {
    RuleKeySet rules;
    std::vector<Entry> entries;

    size_t count() const { return entries.size(); }
};

/**
 * @brief Ordered record of every scanned entry
 *
 * Groupings are computed on demand. Only combinations actually observed
 * produce a group, in the order they were first seen.
 */
class Inventory {
public:
    /**
     * @brief Append an entry in traversal order
     */
    void add(Entry entry);

    const std::vector<Entry>& getEntries() const { return m_entries; }

    std::vector<Entry> files() const;
    std::vector<Entry> directories() const;
    std::vector<Entry> problematicFiles() const;
    std::vector<Entry> problematicDirectories() const;

    size_t fileCount() const;
    size_t directoryCount() const;
    size_t problematicFileCount() const;
    size_t problematicDirectoryCount() const;
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    /**
     * @brief Group the invalid entries of one type by violated-rule set
     * @param type File or directory
     * @return One group per distinct combination, first-seen order
     */
    std::vector<ProblemGroup> problemGroups(EntryType type) const;

    /**
     * @brief Group the invalid entries of both types together
     */
    std::vector<ProblemGroup> problemGroups() const;

    /**
     * @brief Per-group counts for one type
     */
    std::vector<std::pair<RuleKeySet, size_t>> problemGroupCounts(EntryType type) const;

private:
    std::vector<Entry> m_entries;

    template <typename Predicate>
    std::vector<Entry> select(Predicate predicate) const;

    template <typename Predicate>
    std::vector<ProblemGroup> group(Predicate predicate) const;
};

} // namespace Renamarion
