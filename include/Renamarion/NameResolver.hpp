// =================================================================
// include/Renamarion/NameResolver.hpp
// =================================================================
// Computes the sanitized replacement for an invalid entry.

#pragma once

#include "Renamarion/Entry.hpp"
#include "Renamarion/RuleSet.hpp"
#include <filesystem>
#include <string>

namespace Renamarion {

/**
 * @brief An (original, renamed) path pair offered to the operator
 */
struct RenameProposal {
    Entry entry;
    std::filesystem::path original_path;
    std::filesystem::path proposed_path;
    bool applicable = true;       ///< False if the sanitized name is unusable
    std::string problem;          ///< Why the proposal is not applicable

    bool isNoop() const { return original_path == proposed_path; }
};

/**
 * @brief Applies the transforms of violated rules to a name
 *
 * One pass over the violated set captured at classification time, in
 * rule-set iteration order. Violations that a transform introduces for a
 * rule outside that set are not fixed here (e.g. "notes,\r" becomes
 * "notes,"); running the tool again resolves them.
 */
class NameResolver {
public:
    /**
     * @brief Construct a resolver bound to a rule set
     * @param rules Rule set; must outlive the resolver
     */
    explicit NameResolver(const RuleSet& rules);

    /**
     * @brief Apply the transforms of the violated rules to a name
     * @param name Original name
     * @param violated Keys captured at classification time
     * @return Sanitized name
     */
    std::string resolveName(const std::string& name, const RuleKeySet& violated) const;

    /**
     * @brief Compute the sanitized path of an entry
     * @param entry Classified entry
     * @return entry.path unchanged if the entry is valid, otherwise the
     *         original parent joined with the sanitized name
     */
    std::filesystem::path resolve(const Entry& entry) const;

    /**
     * @brief Build the proposal shown to the operator
     * @param entry Classified entry
     * @return Proposal; not applicable if the sanitized name is empty, "." or ".."
     */
    RenameProposal propose(const Entry& entry) const;

private:
    const RuleSet& m_rules;
};

} // namespace Renamarion
