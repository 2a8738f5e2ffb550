// =================================================================
// src/Renamarion/RenameConfig.cpp
// =================================================================
// Implementation for run configuration.

#include "Renamarion/RenameConfig.hpp"
#include "Renamarion/CliParser.hpp"
#include "Renamarion/Errors.hpp"
#include "Renamarion/Logger.hpp"
#include "Renamarion/RuleSet.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>

namespace Renamarion {

void RenameConfig::loadFromFile(const std::string& config_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot read configuration file " + config_path + ": " + e.what());
    }

    if (!root || root.IsNull()) {
        LOG_WARNING("RenameConfig", "Configuration file is empty: " + config_path);
        return;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration file " + config_path + " must contain a mapping");
    }

    try {
        if (root["root"]) {
            root_path = root["root"].as<std::string>();
        }

        if (root["rules"]) {
            YAML::Node rules = root["rules"];
            if (!rules.IsMap()) {
                throw ConfigError("'rules' must map characters to replacements");
            }
            for (YAML::const_iterator it = rules.begin(); it != rules.end(); ++it) {
                std::string replacement = it->second.IsNull() ? "" : it->second.as<std::string>();
                rule_replacements.emplace_back(it->first.as<std::string>(), replacement);
            }
        }

        if (root["review_rules"]) {
            review_rules = root["review_rules"].as<bool>();
        }
        if (root["assume_yes"]) {
            assume_yes = root["assume_yes"].as<bool>();
        }
        if (root["dry_run"]) {
            dry_run = root["dry_run"].as<bool>();
        }
        if (root["color"]) {
            color = root["color"].as<bool>();
        }

        if (root["log"]) {
            YAML::Node log = root["log"];
            if (log["dir"]) {
                log_dir = log["dir"].as<std::string>();
            }
            if (log["level"]) {
                log_level = log["level"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value in " + config_path + ": " + e.what());
    }

    LOG_INFO("RenameConfig", "Loaded configuration from " + config_path);
}

void RenameConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.root_path.empty()) {
        root_path = commands.root_path;
    }
    if (!commands.log_dir.empty()) {
        log_dir = commands.log_dir;
    }
    if (commands.assume_yes) {
        assume_yes = true;
    }
    if (commands.dry_run) {
        dry_run = true;
    }
    if (commands.skip_rule_review) {
        review_rules = false;
    }
    if (commands.no_color) {
        color = false;
    }
    if (commands.verbose) {
        log_level = "debug";
    }
}

void RenameConfig::applyRuleReplacements(RuleSetBuilder& builder) const {
    for (const auto& replacement : rule_replacements) {
        const Rule* rule = builder.find(replacement.first);
        if (rule == nullptr) {
            throw ConfigError("Configuration names unknown rule " +
                              Rule::escapeForDisplay(replacement.first));
        }
        try {
            builder.setReplacement(rule->getKey(), replacement.second);
        } catch (const RuleEditError& e) {
            throw ConfigError(std::string("Invalid rule in configuration: ") + e.what());
        }
    }
}

bool RenameConfig::validate() const {
    bool valid = true;

    LogLevel level;
    if (!Logger::parseLevel(log_level, level)) {
        LOG_ERROR("RenameConfig", "Unknown log level '" + log_level + "'");
        valid = false;
    }

    return valid;
}

std::string RenameConfig::getEffectiveRootPath() const {
    if (!root_path.empty()) {
        return root_path;
    }
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return home;
    }
    return ".";
}

} // namespace Renamarion
