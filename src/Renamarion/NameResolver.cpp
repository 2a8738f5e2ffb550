// =================================================================
// src/Renamarion/NameResolver.cpp
// =================================================================
// Implementation for rename resolution.

#include "Renamarion/NameResolver.hpp"

namespace Renamarion {

NameResolver::NameResolver(const RuleSet& rules) : m_rules(rules) {}

std::string NameResolver::resolveName(const std::string& name, const RuleKeySet& violated) const {
    std::string current = name;
    for (const auto& rule : m_rules) {
        if (violated.count(rule->getKey()) == 0) {
            continue;
        }
        current = rule->apply(current);
    }
    return current;
}

std::filesystem::path NameResolver::resolve(const Entry& entry) const {
    if (!entry.invalid) {
        return entry.path;
    }
    return entry.path.parent_path() / resolveName(entry.getName(), entry.violated);
}

RenameProposal NameResolver::propose(const Entry& entry) const {
    RenameProposal proposal;
    proposal.entry = entry;
    proposal.original_path = entry.path;

    if (!entry.invalid) {
        proposal.proposed_path = entry.path;
        return proposal;
    }

    std::string sanitized = resolveName(entry.getName(), entry.violated);
    proposal.proposed_path = entry.path.parent_path() / sanitized;

    if (sanitized.empty() || sanitized == "." || sanitized == "..") {
        proposal.applicable = false;
        proposal.problem = "sanitized name '" + sanitized + "' is not a usable name";
    }
    return proposal;
}

} // namespace Renamarion
