// =================================================================
// src/Renamarion/ReportPrinter.cpp
// =================================================================
// Implementation for run reports.

#include "Renamarion/ReportPrinter.hpp"
#include "Renamarion/Console.hpp"

namespace Renamarion {

ReportPrinter::ReportPrinter(Console& console, bool show_paths)
    : m_console(console), m_show_paths(show_paths) {}

void ReportPrinter::printRules(const std::vector<RuleSet::RulePtr>& rules) {
    std::ostream& out = m_console.out();
    out << "Forbidden characters are :" << std::endl;
    for (const auto& rule : rules) {
        out << " - " << m_console.paint(rule->getDisplayKey(), Console::GREEN)
            << " " << m_console.paint(rule->describe(), Console::CYAN);
        if (!rule->isEditable()) {
            out << " (fixed)";
        }
        out << std::endl;
    }
    out << std::endl;
}

void ReportPrinter::printScanSummary(const Inventory& inventory) {
    std::ostream& out = m_console.out();
    auto count = [this](size_t value) { return m_console.paint(std::to_string(value), Console::YELLOW); };

    out << "Scanned " << count(inventory.fileCount()) << " total files." << std::endl;
    out << "Scanned " << count(inventory.directoryCount()) << " total directories." << std::endl;
    out << "Found " << count(inventory.problematicFileCount()) << " problematic files." << std::endl;
    out << "Found " << count(inventory.problematicDirectoryCount()) << " problematic directories." << std::endl;

    printGroupCounts("Problems for files :", inventory.problemGroupCounts(EntryType::FILE));
    printGroupCounts("Problems for directories :", inventory.problemGroupCounts(EntryType::DIRECTORY));
}

void ReportPrinter::printSessionSummary(const SessionReport& report, bool dry_run) {
    std::ostream& out = m_console.out();
    out << std::endl << "=== SESSION SUMMARY ===" << std::endl;
    out << "Items reviewed: " << report.total() << std::endl;
    if (dry_run) {
        out << "Would be renamed: " << report.dry_run << std::endl;
    } else {
        out << "Renamed: " << report.renamed << std::endl;
    }
    out << "Not renamed: " << report.not_renamed << std::endl;
    if (report.failed > 0) {
        out << m_console.paint("Failed: " + std::to_string(report.failed), Console::RED) << std::endl;
    }
    if (report.unresolvable > 0) {
        out << m_console.paint("Unresolvable: " + std::to_string(report.unresolvable), Console::RED)
            << std::endl;
    }
    if (report.quit) {
        out << "Session stopped before the end." << std::endl;
    }
}

void ReportPrinter::onGroupStarted(const ProblemGroup& group, EntryType type) {
    m_console.out() << m_console.paint("Problem ", Console::BLUE)
                    << m_console.paint(formatRuleKeySet(group.rules), Console::GREEN)
                    << " (" << group.count() << " " << entryTypeName(type)
                    << (group.count() == 1 ? "" : "s") << ")" << std::endl;
}

void ReportPrinter::onOutcome(const RenameOutcome& outcome) {
    std::ostream& out = m_console.out();
    out << "   ";
    if (m_show_paths || outcome.status == RenameStatus::UNRESOLVABLE) {
        out << outcome.proposal.original_path.string() << " -> "
            << outcome.proposal.proposed_path.string() << " : ";
    }

    std::string status = RenameSession::getStatusName(outcome.status);
    switch (outcome.status) {
        case RenameStatus::RENAMED:
        case RenameStatus::DRY_RUN:
            out << m_console.paint(status, Console::GREEN);
            break;
        case RenameStatus::FAILED:
        case RenameStatus::UNRESOLVABLE:
            out << m_console.paint(status + ": " + outcome.message, Console::RED);
            break;
        case RenameStatus::NOT_RENAMED:
            out << m_console.paint(status, Console::YELLOW);
            break;
    }
    out << std::endl;
}

void ReportPrinter::printGroupCounts(const std::string& title,
                                     const std::vector<std::pair<RuleKeySet, size_t>>& counts) {
    std::ostream& out = m_console.out();
    out << title << std::endl;
    for (const auto& group : counts) {
        out << " - " << m_console.paint(formatRuleKeySet(group.first), Console::GREEN)
            << " contains " << m_console.paint(std::to_string(group.second), Console::CYAN)
            << std::endl;
    }
}

} // namespace Renamarion
