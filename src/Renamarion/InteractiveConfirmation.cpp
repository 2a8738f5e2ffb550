// =================================================================
// src/Renamarion/InteractiveConfirmation.cpp
// =================================================================
// Implementation for the per-item rename confirmation prompt.

#include "Renamarion/InteractiveConfirmation.hpp"
#include "Renamarion/Console.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Renamarion {

InteractiveConfirmation::InteractiveConfirmation(Console& console)
    : m_console(console) {
    initializeKeyBindings();
}

ConfirmationAction InteractiveConfirmation::decide(const RenameProposal& proposal,
                                                   size_t index, size_t total) {
    std::string type_name = entryTypeName(proposal.entry.type);
    type_name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(type_name[0])));

    std::ostringstream prompt;
    prompt << " - [" << index << "/" << total << "] "
           << m_console.paint(type_name + " : ", Console::BLUE)
           << m_console.paint(proposal.original_path.string(), Console::YELLOW)
           << m_console.paint(" will be renamed into ", Console::BLUE)
           << m_console.paint(proposal.proposed_path.string(), Console::YELLOW)
           << m_console.paint(". Do you agree to proceed? [y,n,a,r,q,?]: ", Console::LIGHT_MAGENTA);

    std::string line;
    while (m_console.readLine(prompt.str(), line)) {
        ConfirmationAction action;
        if (!parseUserInput(line, action)) {
            m_console.out() << m_console.paint("Unknown answer '" + line + "'.", Console::RED)
                            << " Type ? for help." << std::endl;
            continue;
        }
        if (action == ConfirmationAction::HELP) {
            displayHelp();
            continue;
        }
        return action;
    }

    return ConfirmationAction::QUIT;
}

bool InteractiveConfirmation::parseUserInput(const std::string& input, ConfirmationAction& action) const {
    std::string normalized = input;
    normalized.erase(0, normalized.find_first_not_of(" \t"));
    normalized.erase(normalized.find_last_not_of(" \t") + 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = m_key_bindings.find(normalized);
    if (it == m_key_bindings.end()) {
        return false;
    }
    action = it->second;
    return true;
}

void InteractiveConfirmation::initializeKeyBindings() {
    m_key_bindings = {
        {"y", ConfirmationAction::ACCEPT},
        {"yes", ConfirmationAction::ACCEPT},
        {"n", ConfirmationAction::REJECT},
        {"no", ConfirmationAction::REJECT},
        {"a", ConfirmationAction::ACCEPT_ALL},
        {"all", ConfirmationAction::ACCEPT_ALL},
        {"r", ConfirmationAction::REJECT_ALL},
        {"reject all", ConfirmationAction::REJECT_ALL},
        {"h", ConfirmationAction::HELP},
        {"help", ConfirmationAction::HELP},
        {"?", ConfirmationAction::HELP},
        {"q", ConfirmationAction::QUIT},
        {"quit", ConfirmationAction::QUIT}
    };
}

void InteractiveConfirmation::displayHelp() {
    std::ostream& out = m_console.out();
    out << "\n--- ACTIONS ---" << std::endl;
    out << "[y] Rename this item" << std::endl;
    out << "[n] Leave this item untouched" << std::endl;
    out << "[a] Rename this item and all remaining items" << std::endl;
    out << "[r] Leave this item and all remaining items untouched" << std::endl;
    out << "[q] Stop now, nothing else is renamed" << std::endl;
    out << "[?] Show this help" << std::endl;
    out << std::endl;
}

} // namespace Renamarion
