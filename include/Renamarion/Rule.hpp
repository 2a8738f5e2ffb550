// =================================================================
// include/Renamarion/Rule.hpp
// =================================================================
// Naming constraints: a check on a file or directory name and the
// transform that fixes a violation of it.

#pragma once

#include <set>
#include <string>

namespace Renamarion {

/**
 * @brief Canonical set of violated rule keys
 *
 * Sorted, so two entries violating {A,B} and {B,A} compare equal. Used
 * directly as the identity of a problem group.
 */
using RuleKeySet = std::set<std::string>;

/**
 * @brief A single naming constraint
 *
 * Implementations guarantee that for every name where matches() is true,
 * matches(apply(name)) is false, and that apply() leaves a name that does
 * not match unchanged.
 */
class Rule {
public:
    virtual ~Rule() = default;

    /**
     * @brief Unique identity of the rule within a RuleSet
     */
    virtual const std::string& getKey() const = 0;

    /**
     * @brief Check whether the name violates this rule
     * @param name File or directory name (no parent path)
     * @return true if the name violates the rule
     */
    virtual bool matches(const std::string& name) const = 0;

    /**
     * @brief Fix this rule's violation in the name
     * @param name File or directory name
     * @return The transformed name
     */
    virtual std::string apply(const std::string& name) const = 0;

    /**
     * @brief Human-readable description of the transform
     */
    virtual std::string describe() const = 0;

    /**
     * @brief Whether the operator may change this rule's replacement
     */
    virtual bool isEditable() const = 0;

    /**
     * @brief Printable form of the key (control and non-ASCII characters escaped)
     */
    std::string getDisplayKey() const { return escapeForDisplay(getKey()); }

    /**
     * @brief Escape control and non-ASCII characters as \r, \xNN or \uXXXX
     * @param text UTF-8 text
     * @return Printable text
     */
    static std::string escapeForDisplay(const std::string& text);
};

/**
 * @brief Forbids one character and substitutes it with a replacement string
 *
 * The character is stored as a UTF-8 sequence, so private-use code points
 * such as U+F022 are a single key.
 */
class LiteralCharacterRule : public Rule {
public:
    LiteralCharacterRule(const std::string& character, const std::string& replacement);

    const std::string& getKey() const override { return m_character; }
    bool matches(const std::string& name) const override;
    std::string apply(const std::string& name) const override;
    std::string describe() const override;
    bool isEditable() const override { return true; }

    const std::string& getReplacement() const { return m_replacement; }

private:
    std::string m_character;
    std::string m_replacement;
};

/**
 * @brief Forbids names ending with any of a set of trailing characters
 *
 * The transform strips trailing characters of the set repeatedly, so
 * "notes , ," becomes "notes".
 */
class TrailingCharacterRule : public Rule {
public:
    static constexpr const char* DEFAULT_KEY = "termination";

    explicit TrailingCharacterRule(const std::string& trailing_characters = ", ",
                                   const std::string& key = DEFAULT_KEY);

    const std::string& getKey() const override { return m_key; }
    bool matches(const std::string& name) const override;
    std::string apply(const std::string& name) const override;
    std::string describe() const override;
    bool isEditable() const override { return false; }

    const std::string& getTrailingCharacters() const { return m_trailing_characters; }

private:
    std::string m_key;
    std::string m_trailing_characters;
};

/**
 * @brief Format a violated-rule set for reports, e.g. "{<, >}"
 */
std::string formatRuleKeySet(const RuleKeySet& keys);

} // namespace Renamarion
