// =================================================================
// src/Renamarion/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Renamarion/CliParser.hpp"

namespace Renamarion {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "Renamarion: finds file and directory names with forbidden characters and renames them.");
    m_app->name("renamarion");

    m_app->add_option("-p,--path", m_commands.root_path,
                      "Root directory to scan (default: your home directory)");
    m_app->add_option("-c,--config", m_commands.config_path,
                      "YAML configuration file")->check(CLI::ExistingFile);
    m_app->add_flag("-y,--yes", m_commands.assume_yes,
                    "Accept every proposed rename without asking");
    m_app->add_flag("--dry-run", m_commands.dry_run,
                    "Review proposed renames without renaming anything");
    m_app->add_flag("--skip-rule-review", m_commands.skip_rule_review,
                    "Do not offer to review the forbidden characters before scanning");
    m_app->add_flag("--no-color", m_commands.no_color,
                    "Disable colored output");
    m_app->add_flag("-v,--verbose", m_commands.verbose,
                    "Print debug log messages");
    m_app->add_option("--log-dir", m_commands.log_dir,
                      "Also write log files to this directory");

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

} // namespace Renamarion
