/**
 * @file req_finder.hpp
 * @brief Read-only lookups into the live graph.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/model/live_model.hpp"

namespace reqsync
{

/**
 * @brief Finds live-graph entities by their stable keys.
 *
 * @details
 * Every scoped lookup accepts a null scope and then reports "not found", so
 * that callers can query below a types folder that does not exist yet.
 *
 * @par Thread safety
 * - Holds a const reference to the model; safe for concurrent use as long as
 *   the model is not modified.
 */
class ReqFinder
{
public:
    explicit ReqFinder(const LiveModel& model)
        : m_model(model)
    {
    }

    /**
     * @brief Find a module by uuid, falling back to its external identifier.
     * @param uuid The module uuid from the tracker configuration.
     * @param external_id Optional identifier of the module in the external tracker.
     * @return The module, or nullptr if neither key resolves.
     */
    ModulePtr reqmodule(const Uuid& uuid, const std::optional<RmIdentifier>& external_id = std::nullopt) const;

    /// Module-wide lookup; identifiers are unique within a module.
    WorkItemPtr work_item_by_identifier(const Module& module, const RmIdentifier& identifier) const;

    RequirementTypesFolderPtr types_folder(const Module& module) const;

    DataTypeDefinitionPtr data_type_definition_by_long_name(
        const RequirementTypesFolder* below, const std::string& long_name) const;

    EnumValuePtr enum_value_by_long_name(const DataTypeDefinition* below, const std::string& long_name) const;

    RequirementTypePtr reqtype_by_identifier(
        const RequirementTypesFolder* below, const RmIdentifier& identifier) const;

    /**
     * @brief Find an attribute definition by identifier below a types folder.
     * @param enumeration Whether an Enum definition is wanted; definitions of
     *        the other family are not matched.
     */
    AttributeDefinitionPtr attribute_definition_by_identifier(
        const RequirementTypesFolder* below, bool enumeration, const std::string& identifier) const;

private:
    const LiveModel& m_model;
};

} // namespace reqsync
