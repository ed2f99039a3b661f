#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include "reqsync/changeset/action_format.hpp"
#include "reqsync/changeset/change_set.hpp"

using namespace reqsync;

namespace
{

const char* to_string(DiagnosticCategory category)
{
    switch (category)
    {
    case DiagnosticCategory::UnknownRequirementType:
        return "UnknownRequirementType";
    case DiagnosticCategory::AttributesWithoutType:
        return "AttributesWithoutType";
    case DiagnosticCategory::AttributeKindChanged:
        return "AttributeKindChanged";
    case DiagnosticCategory::MissingDataTypeDefinition:
        return "MissingDataTypeDefinition";
    case DiagnosticCategory::UnknownEnumLiteral:
        return "UnknownEnumLiteral";
    case DiagnosticCategory::ItemKindChanged:
        return "ItemKindChanged";
    case DiagnosticCategory::ModuleSkipped:
        return "ModuleSkipped";
    }
    return "Unknown";
}

/// A module synchronized once before: one folder holding two requirements.
void populate_live_model(LiveModel& model)
{
    auto module = model.add_module("module-uuid", "project-1", "Project");
    auto types = model.add_types_folder(*module, "types-uuid");

    auto status = model.add_data_type_definition(*types, "status-uuid", "Status");
    auto open = model.add_enum_value(*status, "open-uuid", "Open");
    model.add_enum_value(*status, "closed-uuid", "Closed");

    auto req_type = model.add_requirement_type(*types, "reqtype-uuid", "system_requirement", "System Requirement");
    auto status_def = model.add_attribute_definition(*req_type, "status-def-uuid", "Status", AttributeKind::Enum,
                                                     status, false);
    auto priority_def = model.add_attribute_definition(*req_type, "priority-def-uuid", "Priority",
                                                       AttributeKind::Integer);

    auto folder = model.add_work_item(*module, *module, ItemKind::Folder, "folder-uuid", "100", "Subsystem");
    auto first = model.add_work_item(*module, *folder, ItemKind::Requirement, "req-101-uuid", "101",
                                     "Boot time", req_type, "The system boots in 5 s.");
    model.add_enum_attribute_value(*first, "req-101-status-uuid", status_def, {open});
    model.add_attribute_value(*first, "req-101-priority-uuid", priority_def, Primitive{std::int64_t{2}});

    model.add_work_item(*module, *folder, ItemKind::Requirement, "req-102-uuid", "102", "Shutdown time", req_type);
}

/// The tracker's current state: 101 renamed and reprioritized, 102 moved up, 103 new.
TrackerSnapshot make_snapshot()
{
    TrackerSnapshot snapshot;
    snapshot.id = "project-1";
    snapshot.data_types.insert("Status", {"Open", "Closed", "Blocked"});

    RequirementTypeSpec req_type;
    req_type.long_name = "System Requirement";
    req_type.attributes.insert("Status", AttributeDefinitionSpec{AttributeKind::Enum, false});
    req_type.attributes.insert("Priority", AttributeDefinitionSpec{AttributeKind::Integer, false});
    snapshot.requirement_types.insert("system_requirement", req_type);

    WorkItemSpec first("101", "Boot duration", std::string("system_requirement"),
                       AttributeMap{{"Status", Primitive{std::vector<std::string>{"Open"}}},
                                    {"Priority", Primitive{std::int64_t{1}}}},
                       {}, std::string("The system boots in 5 s."));
    WorkItemSpec third("103", "Restart time", std::string("system_requirement"),
                       AttributeMap{{"Status", Primitive{std::vector<std::string>{"Blocked"}}}});

    snapshot.items.emplace_back("100", "Subsystem", std::nullopt, AttributeMap{},
                                std::vector<WorkItemSpec>{first, third});
    snapshot.items.emplace_back("102", "Shutdown time", std::string("system_requirement"));
    return snapshot;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== reqsync ======\n" << std::flush;

        LiveModel model;
        populate_live_model(model);

        SyncConfig config;
        config.modules.push_back(TrackerConfig{"project-1", std::string("module-uuid"), std::nullopt});
        config.modules.push_back(TrackerConfig{"project-2", std::nullopt, std::nullopt});

        std::vector<TrackerSnapshot> snapshots{make_snapshot()};
        ChangeSet change_set = calculate_change_set(model, config, snapshots);

        std::cout << "\n\n====== actions ======\n" << format_actions(change_set.actions) << std::flush;

        std::cout << "\n\n====== diagnostics ======\n";
        for (const auto& item : change_set.diagnostics.all_items())
        {
            std::cout << (item.severity == DiagnosticSeverity::Error ? "error" : "warning") << " ["
                      << to_string(item.category) << "] " << item.subject << ": " << item.message << "\n";
        }
        std::cout << change_set.summary() << "\n" << std::flush;

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
