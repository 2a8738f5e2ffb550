// =================================================================
// include/Renamarion/RuleSet.hpp
// =================================================================
// Ordered, immutable table of naming rules and the builder that
// prepares it before a scan.

#pragma once

#include "Renamarion/Rule.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Renamarion {

/**
 * @brief Outcome of checking one name against a RuleSet
 */
struct Classification {
    bool invalid = false;     ///< True if at least one rule matches
    RuleKeySet violated;      ///< Keys of every matching rule (empty iff !invalid)

    bool operator==(const Classification& other) const {
        return invalid == other.invalid && violated == other.violated;
    }
};

/**
 * @brief Ordered collection of rules keyed by their identity
 *
 * A RuleSet cannot be modified once constructed. Iteration order is the
 * insertion order and is the order in which transforms are applied.
 */
class RuleSet {
public:
    using RulePtr = std::shared_ptr<const Rule>;
    using const_iterator = std::vector<RulePtr>::const_iterator;

    /**
     * @brief Construct from an ordered list of rules
     * @param rules Rules in application order
     * @throws RenamarionError if two rules share a key or a rule is null
     */
    explicit RuleSet(std::vector<RulePtr> rules);

    /**
     * @brief The default Windows-hostile character table plus the termination rule
     */
    static RuleSet createDefault();

    /**
     * @brief Check a name against every rule
     * @param name File or directory name
     * @return Invalid flag and the set of all violated rule keys
     */
    Classification classify(const std::string& name) const;

    /**
     * @brief Look up a rule by key
     * @return The rule, or nullptr if no rule has this key
     */
    const Rule* find(const std::string& key) const;

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    /**
     * @brief Keys of all rules in iteration order
     */
    std::vector<std::string> getKeys() const;

    size_t size() const { return m_rules.size(); }
    const_iterator begin() const { return m_rules.begin(); }
    const_iterator end() const { return m_rules.end(); }

private:
    std::vector<RulePtr> m_rules;
};

/**
 * @brief Mutable staging area for a RuleSet
 *
 * Starts from the defaults, accepts validated replacement edits one at a
 * time and is frozen into an immutable RuleSet by build().
 */
class RuleSetBuilder {
public:
    RuleSetBuilder() = default;

    /**
     * @brief Builder pre-populated with the default rules
     */
    static RuleSetBuilder withDefaults();

    /**
     * @brief Append a literal-character rule
     * @throws RuleEditError if the key already exists
     */
    RuleSetBuilder& addLiteralRule(const std::string& character, const std::string& replacement);

    /**
     * @brief Append an arbitrary rule
     * @throws RuleEditError if the key already exists
     */
    RuleSetBuilder& addRule(std::shared_ptr<const Rule> rule);

    /**
     * @brief Change the replacement of a literal-character rule
     * @param key Key of the rule to edit
     * @param replacement New substitution string
     * @throws RuleEditError if the key is unknown, the rule is not editable,
     *         or the replacement contains a forbidden character. The
     *         builder is left unchanged on failure.
     */
    void setReplacement(const std::string& key, const std::string& replacement);

    /**
     * @brief Find the first literal key contained in a candidate replacement
     * @param replacement Candidate substitution string
     * @return The offending key, or an empty string if the replacement is acceptable
     */
    std::string findForbiddenCharacter(const std::string& replacement) const;

    /**
     * @brief Look up a rule by key, or by its display form (e.g. "\r")
     * @return The rule, or nullptr if nothing matches
     */
    const Rule* find(const std::string& key_or_display) const;

    const std::vector<RuleSet::RulePtr>& getRules() const { return m_rules; }

    /**
     * @brief Freeze the current rules
     * @return An immutable RuleSet
     * @throws RuleEditError if any literal replacement contains a forbidden character
     */
    RuleSet build() const;

private:
    std::vector<RuleSet::RulePtr> m_rules;

    std::vector<RuleSet::RulePtr>::iterator findByKey(const std::string& key);
};

} // namespace Renamarion
