// =================================================================
// include/Renamarion/Errors.hpp
// =================================================================
// Exception types raised by the rule engine, scanner and configuration.

#pragma once

#include <stdexcept>
#include <string>

namespace Renamarion {

/**
 * @brief Base class for all errors raised by Renamarion
 */
class RenamarionError : public std::runtime_error {
public:
    explicit RenamarionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A rejected edit of a rule's replacement
 *
 * Raised by RuleSetBuilder when the key is unknown, the rule is not
 * editable, or the replacement contains a forbidden character.
 */
class RuleEditError : public RenamarionError {
public:
    RuleEditError(const std::string& rule_key, const std::string& message)
        : RenamarionError(message), m_rule_key(rule_key) {}

    const std::string& getRuleKey() const { return m_rule_key; }

private:
    std::string m_rule_key;
};

/**
 * @brief Fatal error while walking the directory tree
 */
class ScanError : public RenamarionError {
public:
    ScanError(const std::string& path, const std::string& message)
        : RenamarionError("Cannot scan '" + path + "': " + message), m_path(path) {}

    const std::string& getPath() const { return m_path; }

private:
    std::string m_path;
};

/**
 * @brief Unreadable or invalid configuration file
 */
class ConfigError : public RenamarionError {
public:
    explicit ConfigError(const std::string& message)
        : RenamarionError(message) {}
};

} // namespace Renamarion
