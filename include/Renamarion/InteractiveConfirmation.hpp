// =================================================================
// include/Renamarion/InteractiveConfirmation.hpp
// =================================================================
// Header for the per-item rename confirmation prompt.

#pragma once

#include "Renamarion/RenameSession.hpp"
#include <string>
#include <unordered_map>

namespace Renamarion {

class Console;

/**
 * @brief Asks the operator to confirm each proposed rename
 *
 * Accepts single-letter and word answers (y/yes, n/no, a/all,
 * r/reject all, q/quit, h/help/?). Unknown or empty input re-prompts;
 * end of input quits.
 */
class InteractiveConfirmation : public RenameDecider {
public:
    /**
     * @brief Construct a new InteractiveConfirmation
     * @param console Console used for prompts; must outlive this object
     */
    explicit InteractiveConfirmation(Console& console);

    ConfirmationAction decide(const RenameProposal& proposal, size_t index, size_t total) override;

    /**
     * @brief Map an answer to an action
     * @param input Raw answer
     * @param action Receives the action
     * @return False if the answer is not recognized
     */
    bool parseUserInput(const std::string& input, ConfirmationAction& action) const;

private:
    Console& m_console;
    std::unordered_map<std::string, ConfirmationAction> m_key_bindings;

    void initializeKeyBindings();
    void displayHelp();
};

} // namespace Renamarion
