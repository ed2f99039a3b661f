/**
 * @file deletion_ledger.hpp
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/changeset/change_action.hpp"
#include "reqsync/model/live_model.hpp"

namespace reqsync
{

/**
 * @brief Index of proposed work item deletions, allowing their retraction.
 *
 * @details
 * While the work item tree is traversed, a folder that no longer lists one of
 * its live children proposes that child's deletion in the folder's action.
 * If the child turns up later in the traversal under a different parent, it
 * was moved, not removed: the ledger finds the action holding the proposal
 * and retracts it. Children already known to have moved are never proposed,
 * see `is_relocated()`.
 *
 * @par Invariants
 * - Each entity is proposed in at most one action at a time; a new proposal
 *   replaces the recorded one.
 * - After `retract(e)`, no action recorded in the ledger lists `e` in a
 *   delete slot; empty slots and empty delete maps are removed.
 *
 * @par Ownership
 * - The ledger shares ownership of the actions it records; those actions are
 *   also held by the caller's action list and are mutated in place.
 *
 * @par Thread safety
 * - No internal synchronization; owned by a single change-set calculation.
 */
class DeletionLedger
{
public:
    /**
     * @brief Record that `action` proposes the deletion of `entity`.
     * @note The caller adds the reference to `action->deletions` itself; the
     *       slot is "folders" or "requirements" according to the entity's kind.
     */
    void propose(const WorkItem& entity, const ChangeActionPtr& action);

    /**
     * @brief Withdraw a proposed deletion of `entity`.
     * @return True if a proposal was withdrawn, false if none was recorded.
     */
    bool retract(const WorkItem& entity);

    /**
     * @brief Remember that the work item with this identifier has moved.
     */
    void mark_relocated(const RmIdentifier& identifier)
    {
        m_relocated.insert(identifier);
    }

    bool is_relocated(const RmIdentifier& identifier) const
    {
        return m_relocated.count(identifier) != 0;
    }

private:
    struct Proposal
    {
        ChangeActionPtr action;
        ItemKind kind;
    };

    std::unordered_map<Uuid, Proposal> m_proposals;
    std::unordered_set<RmIdentifier> m_relocated;
};

} // namespace reqsync
