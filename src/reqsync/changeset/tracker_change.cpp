/**
 * @file tracker_change.cpp
 */
#include "reqsync/changeset/tracker_change.hpp"
#include "reqsync/changeset/action_assembler.hpp"
#include "reqsync/changeset/deletion_ledger.hpp"
#include "reqsync/changeset/reconcile_context.hpp"
#include "reqsync/changeset/reference_resolver.hpp"
#include "reqsync/changeset/type_system_reconciler.hpp"
#include "reqsync/changeset/value_validator.hpp"
#include "reqsync/changeset/work_item_reconciler.hpp"

namespace reqsync
{

namespace
{

using LabelOwners = std::unordered_map<std::string, std::string>;

void claim(LabelOwners& owners, const std::string& label, std::string owner)
{
    auto [it, inserted] = owners.emplace(label, owner);
    if (!inserted)
    {
        throw ReqSyncError(ReqSyncErrorCode::AmbiguousLabel,
                           "Broken snapshot: " + it->second + " and " + owner + " both derive '" + label + "'");
    }
}

/**
 * @brief Reject snapshots whose names join into the same label.
 *
 * @details
 * Labels and attribute definition identifiers join names with spaces, so
 * names containing spaces can collide, e.g. data type "A B" with literal "C"
 * and data type "A" with literal "B C". Such entities cannot be told apart,
 * neither as promises nor when looked up in the live model.
 */
void check_labels_unique(const TrackerSnapshot& snapshot)
{
    LabelOwners labels;
    for (const auto& [name, values] : snapshot.data_types)
    {
        claim(labels, promise_label::data_type_definition(name), "data type '" + name + "'");
        for (const auto& value : values)
        {
            claim(labels, promise_label::enum_value(name, value),
                  "literal '" + value + "' of data type '" + name + "'");
        }
    }

    LabelOwners definitions;
    for (const auto& [identifier, reqtype] : snapshot.requirement_types)
    {
        claim(labels, promise_label::requirement_type(identifier), "requirement type '" + identifier + "'");
        for (const auto& [name, adef] : reqtype.attributes)
        {
            claim(definitions, attribute_definition_identifier(name, identifier),
                  "attribute '" + name + "' of requirement type '" + identifier + "'");
        }
    }
}

} // namespace

TrackerChange::TrackerChange(const TrackerSnapshot& snapshot, const LiveModel& model, TrackerConfig config)
    : m_snapshot(snapshot)
    , m_finder(model)
    , m_config(std::move(config))
{
    if (!m_config.uuid || m_config.uuid->empty())
    {
        throw ReqSyncError(ReqSyncErrorCode::InvalidTrackerConfig,
                           "Tracker " + m_config.id + " has no module uuid configured");
    }

    m_module = m_finder.reqmodule(*m_config.uuid, m_config.external_id);
    if (!m_module)
    {
        throw ReqSyncError(ReqSyncErrorCode::MissingTargetModule,
                           "No module found for tracker " + m_config.id + " (uuid " + *m_config.uuid + ")");
    }
}

std::vector<ChangeActionPtr> TrackerChange::calculate_change()
{
    m_diagnostics = ReconcileDiagnostics{};
    check_labels_unique(m_snapshot);

    const Module& module = *m_module;
    auto types_folder = m_finder.types_folder(module);
    ReferenceResolver resolver(m_finder, types_folder.get());
    ValueValidator validator(m_snapshot);
    ReconcileContext ctx{m_snapshot, module, types_folder.get(), m_finder, resolver, validator, m_diagnostics};

    std::vector<ChangeActionPtr> actions;
    auto base = std::make_shared<ChangeAction>(Reference::concrete(module.uuid));

    TypeSystemReconciler type_system(ctx);
    if (!types_folder)
    {
        append_extend(*base, "requirement_types_folders", type_system.types_folder_create_payload());
    }
    else
    {
        actions = type_system.actions();
    }

    DeletionLedger ledger;
    WorkItemReconciler work_items(ctx, ledger);
    std::unordered_set<RmIdentifier> visited;
    for (const auto& item : m_snapshot.items)
    {
        visited.insert(item.identifier());
        auto live = m_finder.work_item_by_identifier(module, item.identifier());
        if (!live)
        {
            append_extend(*base, slot_name(item.kind()), work_items.create_payload(item, actions));
            continue;
        }
        if (live->parent != &module)
        {
            append_extend(*base, slot_name(live->kind), Reference::concrete(live->uuid));
        }
        work_items.modify(*live, item, &module, actions);
    }

    ChangeAction deletions(base->parent);
    for (const auto* children : {&module.folders, &module.requirements})
    {
        for (const auto& child : *children)
        {
            if (visited.count(child->identifier) == 0 && !ledger.is_relocated(child->identifier))
            {
                deletions.deletions[slot_name(child->kind)].push_back(Reference::concrete(child->uuid));
            }
        }
    }
    deep_merge(*base, deletions);

    actions.push_back(base);
    prune_void_actions(actions);
    return actions;
}

} // namespace reqsync
