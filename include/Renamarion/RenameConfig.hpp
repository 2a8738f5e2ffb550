// =================================================================
// include/Renamarion/RenameConfig.hpp
// =================================================================
// Configuration for a run: YAML file values, then command-line overrides.

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace Renamarion {

struct Commands;
class RuleSetBuilder;

/**
 * @brief Settings for one run
 */
struct RenameConfig {
    // Scan settings
    std::string root_path;        ///< Empty means the home directory

    // Replacement overrides, in file order, applied through RuleSetBuilder
    std::vector<std::pair<std::string, std::string>> rule_replacements;

    // UI settings
    bool review_rules = true;
    bool assume_yes = false;
    bool dry_run = false;
    bool color = true;

    // Logging settings
    std::string log_dir;          ///< Empty disables file logging
    std::string log_level = "warning";

    /**
     * @brief Load values from a YAML file
     * @param config_path Path to the file
     * @throws ConfigError if the file cannot be read or a value has the wrong type
     */
    void loadFromFile(const std::string& config_path);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Apply the replacement overrides to a builder
     * @throws ConfigError if the builder rejects an override
     */
    void applyRuleReplacements(RuleSetBuilder& builder) const;

    /**
     * @brief Validate configuration settings
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Root directory to scan: root_path, else $HOME, else "."
     */
    std::string getEffectiveRootPath() const;
};

} // namespace Renamarion
