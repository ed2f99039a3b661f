/**
 * @file deletion_ledger.cpp
 */
#include "reqsync/changeset/deletion_ledger.hpp"

namespace reqsync
{

void DeletionLedger::propose(const WorkItem& entity, const ChangeActionPtr& action)
{
    if (!action)
    {
        throw std::invalid_argument("DeletionLedger::propose: null action for " + entity.uuid);
    }
    m_proposals[entity.uuid] = Proposal{action, entity.kind};
}

bool DeletionLedger::retract(const WorkItem& entity)
{
    auto it = m_proposals.find(entity.uuid);
    if (it == m_proposals.end())
    {
        return false;
    }

    ChangeAction& action = *it->second.action;
    const std::string slot = slot_name(it->second.kind);
    m_proposals.erase(it);

    auto slot_it = action.deletions.find(slot);
    if (slot_it == action.deletions.end())
    {
        return false;
    }

    auto& refs = slot_it->second;
    auto ref_it = std::find(refs.begin(), refs.end(), Reference::concrete(entity.uuid));
    if (ref_it == refs.end())
    {
        return false;
    }
    refs.erase(ref_it);

    if (refs.empty())
    {
        action.deletions.erase(slot_it);
    }
    return true;
}

} // namespace reqsync
