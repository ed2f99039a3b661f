/**
 * @file req_finder.cpp
 */
#include "reqsync/model/req_finder.hpp"

namespace reqsync
{

ModulePtr ReqFinder::reqmodule(const Uuid& uuid, const std::optional<RmIdentifier>& external_id) const
{
    for (const auto& module : m_model.modules())
    {
        if (module->uuid == uuid)
        {
            return module;
        }
    }
    if (external_id)
    {
        for (const auto& module : m_model.modules())
        {
            if (module->identifier == *external_id)
            {
                return module;
            }
        }
    }
    return nullptr;
}

WorkItemPtr ReqFinder::work_item_by_identifier(const Module& module, const RmIdentifier& identifier) const
{
    return m_model.work_item_by_identifier(module, identifier);
}

RequirementTypesFolderPtr ReqFinder::types_folder(const Module& module) const
{
    return module.types_folder;
}

DataTypeDefinitionPtr ReqFinder::data_type_definition_by_long_name(
    const RequirementTypesFolder* below, const std::string& long_name) const
{
    if (below == nullptr)
    {
        return nullptr;
    }
    for (const auto& dtdef : below->data_type_definitions)
    {
        if (dtdef->long_name == long_name)
        {
            return dtdef;
        }
    }
    return nullptr;
}

EnumValuePtr ReqFinder::enum_value_by_long_name(const DataTypeDefinition* below, const std::string& long_name) const
{
    if (below == nullptr)
    {
        return nullptr;
    }
    return below->value_by_long_name(long_name);
}

RequirementTypePtr ReqFinder::reqtype_by_identifier(
    const RequirementTypesFolder* below, const RmIdentifier& identifier) const
{
    if (below == nullptr)
    {
        return nullptr;
    }
    for (const auto& reqtype : below->requirement_types)
    {
        if (reqtype->identifier == identifier)
        {
            return reqtype;
        }
    }
    return nullptr;
}

AttributeDefinitionPtr ReqFinder::attribute_definition_by_identifier(
    const RequirementTypesFolder* below, bool enumeration, const std::string& identifier) const
{
    if (below == nullptr)
    {
        return nullptr;
    }
    for (const auto& reqtype : below->requirement_types)
    {
        for (const auto& adef : reqtype->attribute_definitions)
        {
            bool is_enum = adef->kind == AttributeKind::Enum;
            if (is_enum == enumeration && adef->identifier == identifier)
            {
                return adef;
            }
        }
    }
    return nullptr;
}

} // namespace reqsync
