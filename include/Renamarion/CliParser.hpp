// =================================================================
// include/Renamarion/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Renamarion {

// Parsed command-line options. Empty strings and false flags mean
// "not given", so the configuration file value applies.
struct Commands {
    std::string root_path;
    std::string config_path;
    std::string log_dir;
    bool assume_yes = false;
    bool dry_run = false;
    bool skip_rule_review = false;
    bool no_color = false;
    bool verbose = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Renamarion
