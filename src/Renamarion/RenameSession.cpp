// =================================================================
// src/Renamarion/RenameSession.cpp
// =================================================================
// Implementation for the resolution pass.

#include "Renamarion/RenameSession.hpp"
#include "Renamarion/Logger.hpp"
#include "Renamarion/RenameApplier.hpp"

namespace Renamarion {

RenameSession::RenameSession(const NameResolver& resolver,
                             RenameDecider& decider,
                             RenameApplier& applier,
                             SessionListener* listener)
    : m_resolver(resolver),
      m_decider(decider),
      m_applier(applier),
      m_listener(listener),
      m_bulk_mode(BulkMode::NONE) {}

SessionReport RenameSession::run(const Inventory& inventory) {
    SessionReport report;
    m_bulk_mode = BulkMode::NONE;

    const size_t total = inventory.problematicDirectoryCount() + inventory.problematicFileCount();
    size_t index = 0;

    for (EntryType type : {EntryType::DIRECTORY, EntryType::FILE}) {
        for (const auto& group : inventory.problemGroups(type)) {
            if (m_listener != nullptr) {
                m_listener->onGroupStarted(group, type);
            }
            for (const auto& entry : group.entries) {
                record(report, processEntry(entry, ++index, total));
            }
        }
    }

    report.quit = (m_bulk_mode == BulkMode::QUIT);
    return report;
}

std::string RenameSession::getStatusName(RenameStatus status) {
    switch (status) {
        case RenameStatus::RENAMED: return "renamed";
        case RenameStatus::NOT_RENAMED: return "not renamed";
        case RenameStatus::FAILED: return "failed";
        case RenameStatus::UNRESOLVABLE: return "unresolvable";
        case RenameStatus::DRY_RUN: return "dry run";
        default: return "unknown";
    }
}

RenameOutcome RenameSession::processEntry(const Entry& entry, size_t index, size_t total) {
    RenameOutcome outcome;
    outcome.proposal = m_resolver.propose(entry);

    if (!outcome.proposal.applicable) {
        outcome.status = RenameStatus::UNRESOLVABLE;
        outcome.message = outcome.proposal.problem;
        return outcome;
    }

    switch (m_bulk_mode) {
        case BulkMode::ACCEPT_ALL:
            return applyProposal(outcome.proposal);
        case BulkMode::REJECT_ALL:
            outcome.status = RenameStatus::NOT_RENAMED;
            outcome.message = "rejected with all remaining items";
            return outcome;
        case BulkMode::QUIT:
            outcome.status = RenameStatus::NOT_RENAMED;
            outcome.message = "not reviewed";
            return outcome;
        case BulkMode::NONE:
            break;
    }

    ConfirmationAction action = m_decider.decide(outcome.proposal, index, total);
    switch (action) {
        case ConfirmationAction::ACCEPT:
            return applyProposal(outcome.proposal);
        case ConfirmationAction::ACCEPT_ALL:
            m_bulk_mode = BulkMode::ACCEPT_ALL;
            return applyProposal(outcome.proposal);
        case ConfirmationAction::REJECT_ALL:
            m_bulk_mode = BulkMode::REJECT_ALL;
            outcome.status = RenameStatus::NOT_RENAMED;
            outcome.message = "rejected with all remaining items";
            return outcome;
        case ConfirmationAction::QUIT:
            m_bulk_mode = BulkMode::QUIT;
            outcome.status = RenameStatus::NOT_RENAMED;
            outcome.message = "not reviewed";
            return outcome;
        case ConfirmationAction::REJECT:
        case ConfirmationAction::HELP:
        default:
            outcome.status = RenameStatus::NOT_RENAMED;
            outcome.message = "declined";
            return outcome;
    }
}

RenameOutcome RenameSession::applyProposal(const RenameProposal& proposal) {
    RenameOutcome outcome;
    outcome.proposal = proposal;

    ApplyResult result = m_applier.apply(proposal.original_path, proposal.proposed_path);
    if (!result.success) {
        outcome.status = RenameStatus::FAILED;
        outcome.message = result.error_message;
    } else if (m_applier.isDryRun()) {
        outcome.status = RenameStatus::DRY_RUN;
    } else {
        outcome.status = RenameStatus::RENAMED;
    }
    return outcome;
}

void RenameSession::record(SessionReport& report, RenameOutcome outcome) {
    switch (outcome.status) {
        case RenameStatus::RENAMED: report.renamed++; break;
        case RenameStatus::NOT_RENAMED: report.not_renamed++; break;
        case RenameStatus::FAILED: report.failed++; break;
        case RenameStatus::UNRESOLVABLE: report.unresolvable++; break;
        case RenameStatus::DRY_RUN: report.dry_run++; break;
    }

    Logger::getInstance().logRenameOutcome(outcome.proposal.original_path.string(),
                                           outcome.proposal.proposed_path.string(),
                                           getStatusName(outcome.status),
                                           outcome.message);
    if (m_listener != nullptr) {
        m_listener->onOutcome(outcome);
    }
    report.outcomes.push_back(std::move(outcome));
}

} // namespace Renamarion
