// =================================================================
// src/Renamarion/RuleSet.cpp
// =================================================================
// Implementation for the rule table and its builder.

#include "Renamarion/RuleSet.hpp"
#include "Renamarion/Errors.hpp"
#include <algorithm>
#include <unordered_set>

namespace Renamarion {

namespace {

const std::vector<std::pair<std::string, std::string>>& defaultCharacterMapping() {
    static const std::vector<std::pair<std::string, std::string>> mapping = {
        {"<", "("},
        {">", ")"},
        {":", "-"},
        {"\"", "-"},
        {"|", "_"},
        {"?", "."},
        {"*", "x"},
        {"\xEF\x80\xA2", "-"},  // U+F022, left behind by some sync clients
        {"\\", "_"},
        {"\r", ""}
    };
    return mapping;
}

} // namespace

RuleSet::RuleSet(std::vector<RulePtr> rules) : m_rules(std::move(rules)) {
    std::unordered_set<std::string> seen;
    for (const auto& rule : m_rules) {
        if (!rule) {
            throw RenamarionError("RuleSet cannot hold a null rule");
        }
        if (!seen.insert(rule->getKey()).second) {
            throw RenamarionError("Duplicate rule key: " + rule->getDisplayKey());
        }
    }
}

RuleSet RuleSet::createDefault() {
    return RuleSetBuilder::withDefaults().build();
}

Classification RuleSet::classify(const std::string& name) const {
    Classification result;
    for (const auto& rule : m_rules) {
        if (rule->matches(name)) {
            result.violated.insert(rule->getKey());
        }
    }
    result.invalid = !result.violated.empty();
    return result;
}

const Rule* RuleSet::find(const std::string& key) const {
    auto it = std::find_if(m_rules.begin(), m_rules.end(),
                           [&key](const RulePtr& rule) { return rule->getKey() == key; });
    return it != m_rules.end() ? it->get() : nullptr;
}

std::vector<std::string> RuleSet::getKeys() const {
    std::vector<std::string> keys;
    keys.reserve(m_rules.size());
    for (const auto& rule : m_rules) {
        keys.push_back(rule->getKey());
    }
    return keys;
}

RuleSetBuilder RuleSetBuilder::withDefaults() {
    RuleSetBuilder builder;
    for (const auto& mapping : defaultCharacterMapping()) {
        builder.addLiteralRule(mapping.first, mapping.second);
    }
    builder.addRule(std::make_shared<TrailingCharacterRule>());
    return builder;
}

RuleSetBuilder& RuleSetBuilder::addLiteralRule(const std::string& character,
                                               const std::string& replacement) {
    if (character.empty()) {
        throw RuleEditError(character, "A forbidden character cannot be empty");
    }
    return addRule(std::make_shared<LiteralCharacterRule>(character, replacement));
}

RuleSetBuilder& RuleSetBuilder::addRule(std::shared_ptr<const Rule> rule) {
    if (!rule) {
        throw RuleEditError("", "Cannot add a null rule");
    }
    if (findByKey(rule->getKey()) != m_rules.end()) {
        throw RuleEditError(rule->getKey(), "Rule " + rule->getDisplayKey() + " already exists");
    }
    m_rules.push_back(std::move(rule));
    return *this;
}

void RuleSetBuilder::setReplacement(const std::string& key, const std::string& replacement) {
    auto it = findByKey(key);
    if (it == m_rules.end()) {
        throw RuleEditError(key, "Unknown rule " + Rule::escapeForDisplay(key));
    }

    const auto* literal = dynamic_cast<const LiteralCharacterRule*>(it->get());
    if (literal == nullptr || !(*it)->isEditable()) {
        throw RuleEditError(key, "Rule " + (*it)->getDisplayKey() + " cannot be edited");
    }

    std::string forbidden = findForbiddenCharacter(replacement);
    if (!forbidden.empty()) {
        throw RuleEditError(key, "Replacement '" + Rule::escapeForDisplay(replacement) +
                            "' would put the forbidden character '" +
                            Rule::escapeForDisplay(forbidden) + "' in the name");
    }

    *it = std::make_shared<LiteralCharacterRule>(literal->getKey(), replacement);
}

std::string RuleSetBuilder::findForbiddenCharacter(const std::string& replacement) const {
    for (const auto& rule : m_rules) {
        if (dynamic_cast<const LiteralCharacterRule*>(rule.get()) != nullptr) {
            if (replacement.find(rule->getKey()) != std::string::npos) {
                return rule->getKey();
            }
            continue;
        }

        // A replacement ending in a trailing character would make the
        // resolved name end with it whenever the key is last in the name.
        const auto* trailing = dynamic_cast<const TrailingCharacterRule*>(rule.get());
        if (trailing != nullptr && !replacement.empty() &&
            trailing->getTrailingCharacters().find(replacement.back()) != std::string::npos) {
            return std::string(1, replacement.back());
        }
    }
    return "";
}

const Rule* RuleSetBuilder::find(const std::string& key_or_display) const {
    for (const auto& rule : m_rules) {
        if (rule->getKey() == key_or_display) {
            return rule.get();
        }
    }
    for (const auto& rule : m_rules) {
        if (rule->getDisplayKey() == key_or_display) {
            return rule.get();
        }
    }
    return nullptr;
}

RuleSet RuleSetBuilder::build() const {
    for (const auto& rule : m_rules) {
        const auto* literal = dynamic_cast<const LiteralCharacterRule*>(rule.get());
        if (literal == nullptr) {
            continue;
        }
        std::string forbidden = findForbiddenCharacter(literal->getReplacement());
        if (!forbidden.empty()) {
            throw RuleEditError(literal->getKey(),
                                "Replacement for " + literal->getDisplayKey() +
                                " would put the forbidden character '" +
                                Rule::escapeForDisplay(forbidden) + "' in the name");
        }
    }
    return RuleSet(m_rules);
}

std::vector<RuleSet::RulePtr>::iterator RuleSetBuilder::findByKey(const std::string& key) {
    return std::find_if(m_rules.begin(), m_rules.end(),
                        [&key](const RuleSet::RulePtr& rule) { return rule->getKey() == key; });
}

} // namespace Renamarion
