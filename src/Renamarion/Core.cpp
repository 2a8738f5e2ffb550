// =================================================================
// src/Renamarion/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Renamarion/Core.hpp"
#include "Renamarion/Classifier.hpp"
#include "Renamarion/Console.hpp"
#include "Renamarion/DirectoryScanner.hpp"
#include "Renamarion/Errors.hpp"
#include "Renamarion/InteractiveConfirmation.hpp"
#include "Renamarion/Inventory.hpp"
#include "Renamarion/Logger.hpp"
#include "Renamarion/NameResolver.hpp"
#include "Renamarion/RenameApplier.hpp"
#include "Renamarion/RenameSession.hpp"
#include "Renamarion/ReportPrinter.hpp"
#include "Renamarion/RuleEditor.hpp"
#include "Renamarion/RuleSet.hpp"
#include "Renamarion/ScanProgress.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace Renamarion {

Core::Core(const Commands& commands, std::istream& in, std::ostream& out)
    : m_commands(commands), m_in(in), m_out(out) {}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();

    if (!loadConfiguration()) {
        return 1;
    }
    configureLogging();
    m_console = std::make_unique<Console>(m_in, m_out, m_config.color);

    const std::string root_path = m_config.getEffectiveRootPath();
    Logger::getInstance().logSessionStart(root_path);

    auto finish = [&start_time](int exit_code) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        Logger::getInstance().logSessionEnd(exit_code, static_cast<long>(duration.count()));
        return exit_code;
    };

    if (!confirmRoot(root_path)) {
        LOG_INFO("Core", "Root path declined, nothing scanned");
        return finish(0);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_path, ec)) {
        printError("'" + root_path + "' is not a directory.");
        return finish(1);
    }

    std::unique_ptr<RuleSet> rules;
    try {
        if (!prepareRules(rules)) {
            m_out << "Input ended, nothing scanned." << std::endl;
            return finish(0);
        }
    } catch (const RenamarionError& e) {
        printError(e.what());
        return finish(1);
    }

    Classifier classifier(*rules);
    DirectoryScanner scanner(root_path);
    bool show_progress = (&m_out == &std::cout) && isatty(STDOUT_FILENO);
    ScanProgress progress(m_out, show_progress);

    Inventory inventory;
    try {
        inventory = scanner.scan(classifier, &progress);
    } catch (const ScanError& e) {
        progress.finish();
        LOG_ERROR("Core", e.what());
        printError(e.what());
        return finish(1);
    }

    ReportPrinter printer(*m_console);
    printer.printScanSummary(inventory);

    return finish(resolve(inventory, *rules));
}

bool Core::loadConfiguration() {
    try {
        if (!m_commands.config_path.empty()) {
            m_config.loadFromFile(m_commands.config_path);
        }
    } catch (const ConfigError& e) {
        LOG_CRITICAL("Core", e.what());
        printError(e.what());
        return false;
    }

    m_config.applyCommandOverrides(m_commands);
    if (!m_config.validate()) {
        LOG_CRITICAL("Core", "Invalid configuration");
        printError("Invalid configuration.");
        return false;
    }
    return true;
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();

    LogLevel level;
    if (!Logger::parseLevel(m_config.log_level, level)) {
        level = LogLevel::WARNING;
    }
    logger.setConsoleLogLevel(level);
    logger.setColorOutput(m_config.color);

    if (!m_config.log_dir.empty()) {
        if (!logger.enableFileLogging(m_config.log_dir)) {
            LOG_WARNING("Core", "Continuing without log files");
        }
    }
}

bool Core::confirmRoot(const std::string& root_path) {
    m_out << m_console->paint("The path to the selected folder is ", Console::BLUE)
          << m_console->paint(root_path, Console::LIGHT_YELLOW) << std::endl;

    if (m_config.assume_yes) {
        return true;
    }

    bool confirmed = false;
    if (!m_console->confirm(m_console->paint("Is this path the one you planned?", Console::LIGHT_MAGENTA),
                            confirmed)) {
        return false;
    }
    return confirmed;
}

bool Core::prepareRules(std::unique_ptr<RuleSet>& rules) {
    RuleSetBuilder builder = RuleSetBuilder::withDefaults();
    m_config.applyRuleReplacements(builder);

    if (m_config.review_rules && !m_config.assume_yes) {
        ReportPrinter printer(*m_console);
        RuleEditor editor(*m_console, printer);
        if (!editor.run(builder)) {
            return false;
        }
    }

    rules = std::make_unique<RuleSet>(builder.build());
    return true;
}

int Core::resolve(const Inventory& inventory, const RuleSet& rules) {
    if (inventory.problematicFileCount() == 0 && inventory.problematicDirectoryCount() == 0) {
        m_out << "Nothing to rename." << std::endl;
        return 0;
    }

    m_out << std::endl << m_console->paint("Problems Resolution :", Console::BLUE) << std::endl << std::endl;

    NameResolver resolver(rules);

    std::unique_ptr<RenameDecider> decider;
    if (m_config.assume_yes) {
        decider = std::make_unique<AutoAcceptDecider>();
    } else {
        decider = std::make_unique<InteractiveConfirmation>(*m_console);
    }

    std::unique_ptr<RenameApplier> applier;
    if (m_config.dry_run) {
        applier = std::make_unique<DryRunRenameApplier>();
    } else {
        applier = std::make_unique<FilesystemRenameApplier>();
    }

    ReportPrinter printer(*m_console, m_config.assume_yes);
    RenameSession session(resolver, *decider, *applier, &printer);
    SessionReport report = session.run(inventory);
    printer.printSessionSummary(report, m_config.dry_run);

    return 0;
}

void Core::printError(const std::string& message) {
    // Configuration errors are reported before the console exists
    if (!m_console) {
        m_out << "Error: " << message << std::endl;
        return;
    }
    m_out << m_console->paint("Error: " + message, Console::RED) << std::endl;
}

} // namespace Renamarion
