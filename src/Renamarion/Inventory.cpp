// =================================================================
// src/Renamarion/Inventory.cpp
// =================================================================
// Implementation for the scan inventory.

#include "Renamarion/Inventory.hpp"
#include <algorithm>
#include <iterator>
#include <map>

namespace Renamarion {

void Inventory::add(Entry entry) {
    m_entries.push_back(std::move(entry));
}

template <typename Predicate>
std::vector<Entry> Inventory::select(Predicate predicate) const {
    std::vector<Entry> selected;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(selected), predicate);
    return selected;
}

template <typename Predicate>
std::vector<ProblemGroup> Inventory::group(Predicate predicate) const {
    std::vector<ProblemGroup> groups;
    std::map<RuleKeySet, size_t> index;

    for (const auto& entry : m_entries) {
        if (!entry.invalid || !predicate(entry)) {
            continue;
        }
        auto it = index.find(entry.violated);
        if (it == index.end()) {
            it = index.emplace(entry.violated, groups.size()).first;
            groups.push_back(ProblemGroup{entry.violated, {}});
        }
        groups[it->second].entries.push_back(entry);
    }
    return groups;
}

std::vector<Entry> Inventory::files() const {
    return select([](const Entry& e) { return e.type == EntryType::FILE; });
}

std::vector<Entry> Inventory::directories() const {
    return select([](const Entry& e) { return e.type == EntryType::DIRECTORY; });
}

std::vector<Entry> Inventory::problematicFiles() const {
    return select([](const Entry& e) { return e.type == EntryType::FILE && e.invalid; });
}

std::vector<Entry> Inventory::problematicDirectories() const {
    return select([](const Entry& e) { return e.type == EntryType::DIRECTORY && e.invalid; });
}

size_t Inventory::fileCount() const {
    return std::count_if(m_entries.begin(), m_entries.end(),
                         [](const Entry& e) { return e.type == EntryType::FILE; });
}

size_t Inventory::directoryCount() const {
    return std::count_if(m_entries.begin(), m_entries.end(),
                         [](const Entry& e) { return e.type == EntryType::DIRECTORY; });
}

size_t Inventory::problematicFileCount() const {
    return std::count_if(m_entries.begin(), m_entries.end(),
                         [](const Entry& e) { return e.type == EntryType::FILE && e.invalid; });
}

size_t Inventory::problematicDirectoryCount() const {
    return std::count_if(m_entries.begin(), m_entries.end(),
                         [](const Entry& e) { return e.type == EntryType::DIRECTORY && e.invalid; });
}

std::vector<ProblemGroup> Inventory::problemGroups(EntryType type) const {
    return group([type](const Entry& e) { return e.type == type; });
}

std::vector<ProblemGroup> Inventory::problemGroups() const {
    return group([](const Entry&) { return true; });
}

std::vector<std::pair<RuleKeySet, size_t>> Inventory::problemGroupCounts(EntryType type) const {
    std::vector<std::pair<RuleKeySet, size_t>> counts;
    for (const auto& problem_group : problemGroups(type)) {
        counts.emplace_back(problem_group.rules, problem_group.count());
    }
    return counts;
}

} // namespace Renamarion
