// =================================================================
// include/Renamarion/Classifier.hpp
// =================================================================
// Turns scanned (parent, name, type) triples into classified entries.

#pragma once

#include "Renamarion/Entry.hpp"
#include "Renamarion/RuleSet.hpp"
#include <filesystem>
#include <string>

namespace Renamarion {

/**
 * @brief Pure classification of names against a RuleSet
 *
 * No filesystem access. The same input always produces the same output.
 */
class Classifier {
public:
    /**
     * @brief Construct a classifier bound to a rule set
     * @param rules Rule set; must outlive the classifier
     */
    explicit Classifier(const RuleSet& rules);

    /**
     * @brief Classify a bare name
     */
    Classification classify(const std::string& name) const;

    /**
     * @brief Build an Entry for one scanned item
     * @param parent Directory that contains the item
     * @param name Item name
     * @param type File or directory
     * @return Entry with path = parent / name
     */
    Entry classifyEntry(const std::filesystem::path& parent,
                        const std::string& name,
                        EntryType type) const;

    const RuleSet& getRules() const { return m_rules; }

private:
    const RuleSet& m_rules;
};

} // namespace Renamarion
