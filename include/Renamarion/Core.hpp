// =================================================================
// include/Renamarion/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Renamarion/CliParser.hpp"
#include "Renamarion/RenameConfig.hpp"
#include <iostream>
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Renamarion {
    class Console;
    class Inventory;
    class RuleSet;
}

namespace Renamarion {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @param in Stream the operator's answers are read from.
     * @param out Stream the dialogue is written to.
     */
    explicit Core(const Commands& commands,
                  std::istream& in = std::cin,
                  std::ostream& out = std::cout);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs scan, report and resolution.
     * @return 0 on success or when the operator declines the root,
     *         1 on a configuration or scan error.
     */
    int run();

private:
    bool loadConfiguration();
    void configureLogging();
    bool confirmRoot(const std::string& root_path);
    bool prepareRules(std::unique_ptr<RuleSet>& rules);
    int resolve(const Inventory& inventory, const RuleSet& rules);
    void printError(const std::string& message);

    const Commands& m_commands;
    std::istream& m_in;
    std::ostream& m_out;
    RenameConfig m_config;
    std::unique_ptr<Console> m_console;
};

} // namespace Renamarion
