// =================================================================
// include/Renamarion/RenameSession.hpp
// =================================================================
// Header for the resolution pass: proposes, confirms and applies the
// renames of every invalid entry, group by group.

#pragma once

#include "Renamarion/Inventory.hpp"
#include "Renamarion/NameResolver.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace Renamarion {

class RenameApplier;

/**
 * @brief Final state of one proposal
 */
enum class RenameStatus {
    RENAMED,        ///< Confirmed and applied
    NOT_RENAMED,    ///< Declined, or left unreviewed after a quit
    FAILED,         ///< Confirmed but the rename failed
    UNRESOLVABLE,   ///< The sanitized name is unusable
    DRY_RUN         ///< Confirmed and recorded without touching the disk
};

/**
 * @brief Operator decision for a proposal
 */
enum class ConfirmationAction {
    ACCEPT,         ///< Rename this item
    REJECT,         ///< Leave this item untouched
    ACCEPT_ALL,     ///< Rename this and every remaining item
    REJECT_ALL,     ///< Leave this and every remaining item untouched
    HELP,           ///< Show help (handled by the decider)
    QUIT            ///< Stop reviewing, leave the rest untouched
};

/**
 * @brief Outcome of one proposal
 */
struct RenameOutcome {
    RenameProposal proposal;
    RenameStatus status = RenameStatus::NOT_RENAMED;
    std::string message;
};

/**
 * @brief Aggregated result of a resolution pass
 */
struct SessionReport {
    std::vector<RenameOutcome> outcomes;
    size_t renamed = 0;
    size_t not_renamed = 0;
    size_t failed = 0;
    size_t unresolvable = 0;
    size_t dry_run = 0;
    bool quit = false;      ///< True if the operator quit before the end

    size_t total() const { return outcomes.size(); }
};

/**
 * @brief Source of per-proposal decisions (the operator, or an automatic policy)
 */
class RenameDecider {
public:
    virtual ~RenameDecider() = default;

    /**
     * @brief Decide what to do with a proposal
     * @param proposal Proposal to review
     * @param index 1-based position in the session
     * @param total Number of proposals in the session
     * @return Any action except HELP
     */
    virtual ConfirmationAction decide(const RenameProposal& proposal, size_t index, size_t total) = 0;
};

/**
 * @brief Accepts every proposal without asking
 */
class AutoAcceptDecider : public RenameDecider {
public:
    ConfirmationAction decide(const RenameProposal&, size_t, size_t) override {
        return ConfirmationAction::ACCEPT;
    }
};

/**
 * @brief Receives progress of a resolution pass, e.g. to print it
 */
class SessionListener {
public:
    virtual ~SessionListener() = default;

    virtual void onGroupStarted(const ProblemGroup& /*group*/, EntryType /*type*/) {}
    virtual void onOutcome(const RenameOutcome& /*outcome*/) {}
};

/**
 * @brief Drives the resolution pass over an inventory
 *
 * Directory groups are processed before file groups, each in inventory
 * order, one entry at a time. A failed rename is recorded and the pass
 * continues. Renaming a directory makes the proposals of its descendants
 * stale; those then fail as vanished and are reported, not re-resolved.
 */
class RenameSession {
public:
    /**
     * @brief Construct a session
     * @param resolver Resolver bound to the frozen rule set
     * @param decider Decision source
     * @param applier Rename capability
     * @param listener Optional progress receiver
     */
    RenameSession(const NameResolver& resolver,
                  RenameDecider& decider,
                  RenameApplier& applier,
                  SessionListener* listener = nullptr);

    /**
     * @brief Run the pass
     * @param inventory Scanned entries
     * @return Outcome of every invalid entry
     */
    SessionReport run(const Inventory& inventory);

    /**
     * @brief Human-readable status label, e.g. "renamed" or "not renamed"
     */
    static std::string getStatusName(RenameStatus status);

private:
    enum class BulkMode { NONE, ACCEPT_ALL, REJECT_ALL, QUIT };

    const NameResolver& m_resolver;
    RenameDecider& m_decider;
    RenameApplier& m_applier;
    SessionListener* m_listener;
    BulkMode m_bulk_mode;

    RenameOutcome processEntry(const Entry& entry, size_t index, size_t total);
    RenameOutcome applyProposal(const RenameProposal& proposal);
    void record(SessionReport& report, RenameOutcome outcome);
};

} // namespace Renamarion
