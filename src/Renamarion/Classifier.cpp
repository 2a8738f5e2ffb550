// =================================================================
// src/Renamarion/Classifier.cpp
// =================================================================
// Implementation for name classification.

#include "Renamarion/Classifier.hpp"

namespace Renamarion {

Classifier::Classifier(const RuleSet& rules) : m_rules(rules) {}

Classification Classifier::classify(const std::string& name) const {
    return m_rules.classify(name);
}

Entry Classifier::classifyEntry(const std::filesystem::path& parent,
                                const std::string& name,
                                EntryType type) const {
    Classification classification = classify(name);

    Entry entry;
    entry.type = type;
    entry.path = parent / name;
    entry.invalid = classification.invalid;
    entry.violated = std::move(classification.violated);
    return entry;
}

} // namespace Renamarion
