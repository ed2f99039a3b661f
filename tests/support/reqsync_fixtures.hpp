/**
 * @file reqsync_fixtures.hpp
 * @brief Shared live models, snapshots and action inspection helpers for tests.
 */
#pragma once
#include "reqsync/changeset/change_action.hpp"
#include "reqsync/changeset/reconcile_context.hpp"
#include "reqsync/changeset/tracker_change.hpp"
#include "reqsync/model/live_model.hpp"
#include "reqsync/snapshot/tracker_snapshot.hpp"

namespace reqsync_test
{

using namespace reqsync;

// ============================================================================
// Value shorthands
// ============================================================================

/// Text value. A bare string literal would select the bool alternative.
inline Primitive text(const char* value)
{
    return Primitive{std::string(value)};
}

inline Primitive literals(std::vector<std::string> values)
{
    return Primitive{std::move(values)};
}

inline Primitive integer(std::int64_t value)
{
    return Primitive{value};
}

// ============================================================================
// Aligned fixture
// ============================================================================

/**
 * @brief A live module and the snapshot it was last synchronized from.
 *
 * @details
 * Live layout (uuids in parentheses):
 * - module "project-1" (module-uuid), types folder (types-uuid)
 *   - data type Status (status-uuid): Open (open-uuid), Closed (closed-uuid)
 *   - requirement type "sysreq" (reqtype-uuid) with attribute definitions
 *     Status, Enum (status-def-uuid) and Priority, Integer (priority-def-uuid)
 * - folder "100" (folder-100-uuid)
 *   - requirement "101" (req-101-uuid): Status [Open], Priority 1, text "t101"
 *   - requirement "102" (req-102-uuid): Priority 2
 * - folder "200" (folder-200-uuid)
 *   - requirement "201" (req-201-uuid)
 * - requirement "300" (req-300-uuid)
 *
 * Every requirement has type "sysreq"; folders are untyped.
 */
struct AlignedFixture
{
    LiveModel model;
    ModulePtr module;
    RequirementTypesFolderPtr types;
    DataTypeDefinitionPtr status;
    EnumValuePtr open;
    EnumValuePtr closed;
    RequirementTypePtr reqtype;
    AttributeDefinitionPtr status_def;
    AttributeDefinitionPtr priority_def;
    WorkItemPtr folder_100;
    WorkItemPtr req_101;
    WorkItemPtr req_102;
    WorkItemPtr folder_200;
    WorkItemPtr req_201;
    WorkItemPtr req_300;

    TrackerConfig config{"project-1", std::string("module-uuid"), std::nullopt};

    AlignedFixture()
    {
        module = model.add_module("module-uuid", "project-1", "Project");
        types = model.add_types_folder(*module, "types-uuid");
        status = model.add_data_type_definition(*types, "status-uuid", "Status");
        open = model.add_enum_value(*status, "open-uuid", "Open");
        closed = model.add_enum_value(*status, "closed-uuid", "Closed");
        reqtype = model.add_requirement_type(*types, "reqtype-uuid", "sysreq", "System Requirement");
        status_def = model.add_attribute_definition(*reqtype, "status-def-uuid", "Status", AttributeKind::Enum,
                                                    status, false);
        priority_def = model.add_attribute_definition(*reqtype, "priority-def-uuid", "Priority",
                                                      AttributeKind::Integer);

        folder_100 = model.add_work_item(*module, *module, ItemKind::Folder, "folder-100-uuid", "100", "Folder 100");
        req_101 = model.add_work_item(*module, *folder_100, ItemKind::Requirement, "req-101-uuid", "101",
                                      "Requirement 101", reqtype, "t101");
        model.add_enum_attribute_value(*req_101, "req-101-status-uuid", status_def, {open});
        model.add_attribute_value(*req_101, "req-101-priority-uuid", priority_def, integer(1));
        req_102 = model.add_work_item(*module, *folder_100, ItemKind::Requirement, "req-102-uuid", "102",
                                      "Requirement 102", reqtype);
        model.add_attribute_value(*req_102, "req-102-priority-uuid", priority_def, integer(2));

        folder_200 = model.add_work_item(*module, *module, ItemKind::Folder, "folder-200-uuid", "200", "Folder 200");
        req_201 = model.add_work_item(*module, *folder_200, ItemKind::Requirement, "req-201-uuid", "201",
                                      "Requirement 201", reqtype);

        req_300 = model.add_work_item(*module, *module, ItemKind::Requirement, "req-300-uuid", "300",
                                      "Requirement 300", reqtype);
    }

    static RequirementTypeSpec sysreq_spec()
    {
        RequirementTypeSpec spec;
        spec.long_name = "System Requirement";
        spec.attributes.insert("Status", AttributeDefinitionSpec{AttributeKind::Enum, false});
        spec.attributes.insert("Priority", AttributeDefinitionSpec{AttributeKind::Integer, false});
        return spec;
    }

    static WorkItemSpec req_101_spec()
    {
        return WorkItemSpec("101", "Requirement 101", std::string("sysreq"),
                            AttributeMap{{"Status", literals({"Open"})}, {"Priority", integer(1)}}, {},
                            std::string("t101"));
    }

    static WorkItemSpec req_102_spec()
    {
        return WorkItemSpec("102", "Requirement 102", std::string("sysreq"), AttributeMap{{"Priority", integer(2)}});
    }

    static WorkItemSpec req_201_spec()
    {
        return WorkItemSpec("201", "Requirement 201", std::string("sysreq"));
    }

    static WorkItemSpec req_300_spec()
    {
        return WorkItemSpec("300", "Requirement 300", std::string("sysreq"));
    }

    static WorkItemSpec folder_spec(const char* identifier, const char* long_name, std::vector<WorkItemSpec> children)
    {
        return WorkItemSpec(identifier, long_name, std::nullopt, AttributeMap{}, std::move(children));
    }

    /// The snapshot the live module is aligned with; tests modify a copy.
    static TrackerSnapshot snapshot()
    {
        TrackerSnapshot result;
        result.id = "project-1";
        result.data_types.insert("Status", {"Open", "Closed"});
        result.requirement_types.insert("sysreq", sysreq_spec());
        result.items.push_back(folder_spec("100", "Folder 100", {req_101_spec(), req_102_spec()}));
        result.items.push_back(folder_spec("200", "Folder 200", {req_201_spec()}));
        result.items.push_back(req_300_spec());
        return result;
    }
};

/**
 * @brief A live module that was never synchronized: no types folder, no items.
 */
struct EmptyModuleFixture
{
    LiveModel model;
    ModulePtr module;
    TrackerConfig config{"project-1", std::string("module-uuid"), std::nullopt};

    EmptyModuleFixture()
    {
        module = model.add_module("module-uuid", "project-1", "Project");
    }
};

/**
 * @brief The collaborators of one module's reconciliation, wired like `TrackerChange` does.
 */
struct ContextHarness
{
    ReqFinder finder;
    ReferenceResolver resolver;
    ValueValidator validator;
    ReconcileDiagnostics diagnostics;
    ReconcileContext ctx;

    ContextHarness(const TrackerSnapshot& snapshot, const LiveModel& model, const Module& module)
        : finder(model)
        , resolver(finder, module.types_folder.get())
        , validator(snapshot)
        , ctx{snapshot, module, module.types_folder.get(), finder, resolver, validator, diagnostics}
    {
    }
};

// ============================================================================
// Action inspection
// ============================================================================

/**
 * @brief Find the action whose parent is the given reference.
 * @return The first such action, or nullptr.
 */
inline ChangeActionPtr find_action(const std::vector<ChangeActionPtr>& actions, const Reference& parent)
{
    for (const auto& action : actions)
    {
        if (action->parent == parent)
        {
            return action;
        }
    }
    return nullptr;
}

/**
 * @brief Everything an action list declares, references, moves or deletes.
 */
struct ActionCensus
{
    /// Promise labels declared by creations.
    std::vector<std::string> declared;

    /// Promise labels referenced anywhere (parents, fields, extend entries).
    std::vector<std::string> promised;

    /// Uuids of concrete references in extend slots (moved entities).
    std::vector<std::string> moved;

    /// Uuids of concrete references in delete slots.
    std::vector<std::string> deleted;

    std::size_t creations{0};
};

namespace detail
{

inline void note_reference(ActionCensus& census, const Reference& ref)
{
    if (ref.is_promise())
    {
        census.promised.push_back(ref.key());
    }
}

inline void note_field(ActionCensus& census, const FieldValue& value)
{
    if (const auto* ref = std::get_if<Reference>(&value))
    {
        note_reference(census, *ref);
    }
    else if (const auto* refs = std::get_if<std::vector<Reference>>(&value))
    {
        for (const auto& r : *refs)
        {
            note_reference(census, r);
        }
    }
    else if (const auto* changes = std::get_if<AttributeChanges>(&value))
    {
        for (const auto& [name, change] : *changes)
        {
            if (const auto* change_refs = std::get_if<std::vector<Reference>>(&change))
            {
                for (const auto& r : *change_refs)
                {
                    note_reference(census, r);
                }
            }
        }
    }
}

inline void note_slots(ActionCensus& census, const ExtendMap& slots);

inline void note_payload(ActionCensus& census, const CreatePayload& payload)
{
    ++census.creations;
    if (!payload.promise_id.empty())
    {
        census.declared.push_back(payload.promise_id);
    }
    for (const auto& [name, value] : payload.fields)
    {
        note_field(census, value);
    }
    note_slots(census, payload.children);
}

inline void note_slots(ActionCensus& census, const ExtendMap& slots)
{
    for (const auto& [slot, entries] : slots)
    {
        for (const auto& entry : entries)
        {
            if (const auto* ref = std::get_if<Reference>(&entry))
            {
                if (ref->is_concrete())
                {
                    census.moved.push_back(ref->key());
                }
                note_reference(census, *ref);
            }
            else
            {
                note_payload(census, *std::get<CreatePayloadPtr>(entry));
            }
        }
    }
}

} // namespace detail

inline ActionCensus take_census(const std::vector<ChangeActionPtr>& actions)
{
    ActionCensus census;
    for (const auto& action : actions)
    {
        detail::note_reference(census, action->parent);
        for (const auto& [name, value] : action->modify)
        {
            detail::note_field(census, value);
        }
        detail::note_slots(census, action->extend);
        for (const auto& [slot, refs] : action->deletions)
        {
            for (const auto& ref : refs)
            {
                census.deleted.push_back(ref.key());
            }
        }
    }
    return census;
}

inline bool contains(const std::vector<std::string>& values, const std::string& value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

/// The payload at `index` of a slot; fails the calling test if it is a reference.
inline const CreatePayload& payload_at(const SlotEntries& entries, std::size_t index)
{
    return *std::get<CreatePayloadPtr>(entries.at(index));
}

/// Run a single-module calculation.
inline std::vector<ChangeActionPtr> calculate(const TrackerSnapshot& snapshot, const LiveModel& model,
                                              const TrackerConfig& config)
{
    TrackerChange change(snapshot, model, config);
    return change.calculate_change();
}

} // namespace reqsync_test
