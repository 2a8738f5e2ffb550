// =================================================================
// include/Renamarion/ReportPrinter.hpp
// =================================================================
// Header for the human-readable reports of a run.

#pragma once

#include "Renamarion/Inventory.hpp"
#include "Renamarion/RenameSession.hpp"
#include "Renamarion/RuleSet.hpp"
#include <vector>

namespace Renamarion {

class Console;

/**
 * @brief Prints rule tables, scan counts, group breakdowns and outcomes
 */
class ReportPrinter : public SessionListener {
public:
    /**
     * @brief Construct a printer
     * @param console Console to print on; must outlive the printer
     * @param show_paths Repeat the paths on every outcome line, for
     *        sessions where no prompt shows them
     */
    explicit ReportPrinter(Console& console, bool show_paths = false);

    /**
     * @brief Print every rule and what it does
     */
    void printRules(const std::vector<RuleSet::RulePtr>& rules);

    /**
     * @brief Print the four totals and the per-group breakdowns
     */
    void printScanSummary(const Inventory& inventory);

    /**
     * @brief Print the totals of a resolution pass
     */
    void printSessionSummary(const SessionReport& report, bool dry_run);

    void onGroupStarted(const ProblemGroup& group, EntryType type) override;
    void onOutcome(const RenameOutcome& outcome) override;

private:
    Console& m_console;
    bool m_show_paths;

    void printGroupCounts(const std::string& title,
                          const std::vector<std::pair<RuleKeySet, size_t>>& counts);
};

} // namespace Renamarion
