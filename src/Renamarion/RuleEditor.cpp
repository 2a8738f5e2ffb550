// =================================================================
// src/Renamarion/RuleEditor.cpp
// =================================================================
// Implementation for the rule review loop.

#include "Renamarion/RuleEditor.hpp"
#include "Renamarion/Console.hpp"
#include "Renamarion/Errors.hpp"
#include "Renamarion/Logger.hpp"
#include "Renamarion/ReportPrinter.hpp"
#include "Renamarion/RuleSet.hpp"

namespace Renamarion {

RuleEditor::RuleEditor(Console& console, ReportPrinter& printer)
    : m_console(console), m_printer(printer) {}

bool RuleEditor::run(RuleSetBuilder& builder) {
    while (true) {
        m_printer.printRules(builder.getRules());

        bool accepted = false;
        if (!m_console.confirm(m_console.paint("Do you find this to be ok?", Console::LIGHT_MAGENTA),
                               accepted)) {
            return false;
        }
        if (accepted) {
            return true;
        }
        if (!editOne(builder)) {
            return false;
        }
    }
}

bool RuleEditor::editOne(RuleSetBuilder& builder) {
    const Rule* rule = nullptr;
    std::string line;

    while (rule == nullptr) {
        if (!m_console.readLine(m_console.paint("What character to edit? ", Console::LIGHT_MAGENTA), line)) {
            return false;
        }
        rule = builder.find(line);
        if (rule == nullptr) {
            m_console.out() << m_console.paint("'" + line + "' is not a forbidden character.", Console::RED)
                            << std::endl;
        } else if (!rule->isEditable()) {
            m_console.out() << m_console.paint("Rule " + rule->getDisplayKey() + " cannot be edited.",
                                               Console::RED) << std::endl;
            rule = nullptr;
        }
    }

    const std::string key = rule->getKey();
    while (true) {
        if (!m_console.readLine(m_console.paint("What character to replace it with? ", Console::LIGHT_MAGENTA),
                                line)) {
            return false;
        }
        try {
            builder.setReplacement(key, line);
            Logger::getInstance().logRuleEdit(Rule::escapeForDisplay(key), Rule::escapeForDisplay(line));
            return true;
        } catch (const RuleEditError& e) {
            LOG_DEBUG("RuleEditor", e.what());
            m_console.out() << m_console.paint(
                "Invalid input, as it would leave a forbidden character in the name. Please try again.", Console::RED)
                            << std::endl;
        }
    }
}

} // namespace Renamarion
