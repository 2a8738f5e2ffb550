// =================================================================
// include/Renamarion/RuleEditor.hpp
// =================================================================
// Header for the interactive review of the forbidden-character table.

#pragma once

namespace Renamarion {

class Console;
class ReportPrinter;
class RuleSetBuilder;

/**
 * @brief Lets the operator change replacements before the scan
 *
 * Shows the table until the operator accepts it. Each edit picks one
 * editable rule and a new replacement; a replacement containing a
 * forbidden character is rejected and asked again.
 */
class RuleEditor {
public:
    RuleEditor(Console& console, ReportPrinter& printer);

    /**
     * @brief Run the review loop
     * @param builder Builder receiving the edits
     * @return False if input ended before the table was accepted
     */
    bool run(RuleSetBuilder& builder);

private:
    Console& m_console;
    ReportPrinter& m_printer;

    bool editOne(RuleSetBuilder& builder);
};

} // namespace Renamarion
