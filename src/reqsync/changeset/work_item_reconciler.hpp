/**
 * @file work_item_reconciler.hpp
 * @brief Reconciliation of the folder and requirement tree.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/changeset/change_action.hpp"
#include "reqsync/changeset/deletion_ledger.hpp"
#include "reqsync/changeset/reconcile_context.hpp"

namespace reqsync
{

/**
 * @brief Diffs snapshot work items against the live folder and requirement tree.
 *
 * @details
 * Work items are matched by identifier across the whole module, not by
 * position. A snapshot node without a live counterpart becomes a creation
 * payload; a matched node becomes a modification action on the live entity.
 *
 * @par Relocation
 * A matched entity whose live parent is not the container the traversal
 * reached it from has moved. The caller adds a concrete reference to it in
 * the new container's extend slot (chosen by the live entity's kind), and
 * `modify()` records the move in the `DeletionLedger`, retracting a deletion
 * the old container may already have proposed.
 *
 * @par Attributes
 * Attribute values are only processed when the node names a requirement type
 * that the snapshot declares. A node with attributes but no type, or with an
 * undeclared type, is reported as a warning and keeps its live attributes;
 * the node itself is still created or modified. Attributes the type does not
 * declare, and the `("Type", "Folder")` marker, are never stored.
 *
 * @par Output order
 * Actions are appended to `out` depth first: a node's own action precedes
 * those of its descendants. Void actions are left in place for the caller to
 * prune, because a later relocation may still empty them.
 */
class WorkItemReconciler
{
public:
    WorkItemReconciler(const ReconcileContext& ctx, DeletionLedger& ledger)
        : m_ctx(ctx)
        , m_ledger(ledger)
    {
    }

    /**
     * @brief Describe the creation of a snapshot node and its subtree.
     *
     * @details
     * Children without a live counterpart are nested as creation payloads;
     * children that exist elsewhere are nested as concrete references and
     * reconciled as moved entities, their actions being appended to `out`.
     *
     * @throw InvalidFieldValueError if an attribute value fails validation.
     */
    CreatePayloadPtr create_payload(const WorkItemSpec& spec, std::vector<ChangeActionPtr>& out);

    /**
     * @brief Compute the modification of a live work item and its subtree.
     * @param live The matched live entity.
     * @param spec Its snapshot node.
     * @param expected_parent The container the traversal reached `spec` from;
     *        nullptr if that container is being created in this batch.
     * @param out Receives the entity's action followed by those of its subtree.
     * @throw InvalidFieldValueError if an attribute value fails validation.
     */
    void modify(const WorkItem& live, const WorkItemSpec& spec, const ItemContainer* expected_parent,
                std::vector<ChangeActionPtr>& out);

    /**
     * @brief Describe the creation of one attribute value.
     * @param reqtype_identifier The requirement type declaring the attribute.
     * @throw InvalidFieldValueError if the value fails validation.
     */
    CreatePayloadPtr attribute_value_payload(const std::string& name, const Primitive& value,
                                             const RmIdentifier& reqtype_identifier,
                                             const RequirementTypeSpec& reqtype);

private:
    /**
     * @brief The declared requirement type whose attributes the node may carry.
     * @return nullptr if the node names no type or an undeclared one; the
     *         anomaly is reported as a warning where attributes are affected.
     */
    const RequirementTypeSpec* attribute_scope(const WorkItemSpec& spec) const;

    /// Whether attribute processing was given up for the node.
    bool attributes_abandoned(const WorkItemSpec& spec, const RequirementTypeSpec* scope) const;

    void diff_type(const WorkItem& live, const WorkItemSpec& spec, ChangeAction& action) const;

    void diff_attributes(const WorkItem& live, const WorkItemSpec& spec, const RequirementTypeSpec* scope,
                         ChangeAction& action);

    void reconcile_children(const WorkItem& live, const WorkItemSpec& spec, const ChangeActionPtr& action,
                            std::vector<ChangeActionPtr>& out);

    /// References to the declared literals of an Enum value; undeclared ones are reported.
    std::vector<Reference> enum_value_references(const std::string& name, const std::vector<std::string>& literals);

private:
    const ReconcileContext& m_ctx;
    DeletionLedger& m_ledger;
};

/**
 * @brief Check whether a snapshot node carries attributes that would be stored.
 */
bool has_stored_attributes(const WorkItemSpec& spec);

} // namespace reqsync
