/**
 * @file live_model.cpp
 */
#include "reqsync/model/live_model.hpp"

namespace reqsync
{

// ============================================================================
// Entity lookups
// ============================================================================

EnumValuePtr DataTypeDefinition::value_by_long_name(const std::string& name) const
{
    for (const auto& value : values)
    {
        if (value->long_name == name)
        {
            return value;
        }
    }
    return nullptr;
}

AttributeDefinitionPtr RequirementType::attribute_definition_by_long_name(const std::string& name) const
{
    for (const auto& adef : attribute_definitions)
    {
        if (adef->long_name == name)
        {
            return adef;
        }
    }
    return nullptr;
}

std::string attribute_definition_identifier(
    const std::string& attribute_name, const RmIdentifier& reqtype_identifier)
{
    return attribute_name + " " + reqtype_identifier;
}

// ============================================================================
// LiveModel population
// ============================================================================

void LiveModel::claim_uuid(const Uuid& uuid)
{
    if (uuid.empty())
    {
        throw std::invalid_argument("LiveModel: empty uuid");
    }
    if (!m_uuids.insert(uuid).second)
    {
        throw std::invalid_argument("LiveModel: duplicate uuid " + uuid);
    }
}

ModulePtr LiveModel::add_module(const Uuid& uuid, const RmIdentifier& identifier, const std::string& long_name)
{
    claim_uuid(uuid);
    auto module = std::make_shared<Module>();
    module->uuid = uuid;
    module->identifier = identifier;
    module->long_name = long_name;
    m_modules.push_back(module);
    m_work_items[uuid];
    return module;
}

RequirementTypesFolderPtr LiveModel::add_types_folder(Module& module, const Uuid& uuid,
                                                      const std::string& identifier,
                                                      const std::string& long_name)
{
    if (module.types_folder)
    {
        throw std::invalid_argument(
            "LiveModel: module " + module.uuid + " already owns a requirement types folder");
    }
    claim_uuid(uuid);
    auto folder = std::make_shared<RequirementTypesFolder>();
    folder->uuid = uuid;
    folder->identifier = identifier;
    folder->long_name = long_name;
    module.types_folder = folder;
    return folder;
}

DataTypeDefinitionPtr LiveModel::add_data_type_definition(RequirementTypesFolder& folder, const Uuid& uuid,
                                                          const std::string& long_name)
{
    claim_uuid(uuid);
    auto dtdef = std::make_shared<DataTypeDefinition>();
    dtdef->uuid = uuid;
    dtdef->long_name = long_name;
    folder.data_type_definitions.push_back(dtdef);
    return dtdef;
}

EnumValuePtr LiveModel::add_enum_value(DataTypeDefinition& dtdef, const Uuid& uuid, const std::string& long_name)
{
    claim_uuid(uuid);
    auto value = std::make_shared<EnumValue>();
    value->uuid = uuid;
    value->long_name = long_name;
    dtdef.values.push_back(value);
    return value;
}

RequirementTypePtr LiveModel::add_requirement_type(RequirementTypesFolder& folder, const Uuid& uuid,
                                                   const RmIdentifier& identifier, const std::string& long_name)
{
    claim_uuid(uuid);
    auto reqtype = std::make_shared<RequirementType>();
    reqtype->uuid = uuid;
    reqtype->identifier = identifier;
    reqtype->long_name = long_name;
    folder.requirement_types.push_back(reqtype);
    return reqtype;
}

AttributeDefinitionPtr LiveModel::add_attribute_definition(RequirementType& reqtype, const Uuid& uuid,
                                                           const std::string& long_name, AttributeKind kind,
                                                           DataTypeDefinitionPtr data_type,
                                                           bool multi_valued)
{
    claim_uuid(uuid);
    auto adef = std::make_shared<AttributeDefinition>();
    adef->uuid = uuid;
    adef->identifier = attribute_definition_identifier(long_name, reqtype.identifier);
    adef->long_name = long_name;
    adef->kind = kind;
    if (kind == AttributeKind::Enum)
    {
        adef->data_type = std::move(data_type);
        adef->multi_valued = multi_valued;
    }
    reqtype.attribute_definitions.push_back(adef);
    return adef;
}

WorkItemPtr LiveModel::add_work_item(Module& module, ItemContainer& parent, ItemKind kind, const Uuid& uuid,
                                     const RmIdentifier& identifier, const std::string& long_name,
                                     RequirementTypePtr type, const std::string& text)
{
    auto* parent_item = dynamic_cast<WorkItem*>(&parent);
    if (parent_item != nullptr && !parent_item->is_folder())
    {
        throw std::invalid_argument(
            "LiveModel: requirement " + parent_item->identifier + " cannot own work items");
    }

    auto& index = m_work_items[module.uuid];
    if (index.count(identifier) != 0)
    {
        throw std::invalid_argument(
            "LiveModel: duplicate identifier " + identifier + " in module " + module.uuid);
    }
    claim_uuid(uuid);

    auto item = std::make_shared<WorkItem>();
    item->uuid = uuid;
    item->kind = kind;
    item->identifier = identifier;
    item->long_name = long_name;
    item->text = text;
    item->type = std::move(type);
    item->parent = &parent;

    if (kind == ItemKind::Folder)
    {
        parent.folders.push_back(item);
    }
    else
    {
        parent.requirements.push_back(item);
    }
    index.emplace(identifier, item);
    return item;
}

AttributeValuePtr LiveModel::add_attribute_value(WorkItem& item, const Uuid& uuid,
                                                 AttributeDefinitionPtr definition, Primitive value)
{
    if (!definition || definition->kind == AttributeKind::Enum)
    {
        throw std::invalid_argument("LiveModel: scalar attribute value needs a non-Enum definition");
    }
    claim_uuid(uuid);
    auto attr = std::make_shared<AttributeValue>();
    attr->uuid = uuid;
    attr->definition = std::move(definition);
    attr->value = std::move(value);
    item.attributes.push_back(attr);
    return attr;
}

AttributeValuePtr LiveModel::add_enum_attribute_value(WorkItem& item, const Uuid& uuid,
                                                      AttributeDefinitionPtr definition,
                                                      std::vector<EnumValuePtr> values)
{
    if (!definition || definition->kind != AttributeKind::Enum)
    {
        throw std::invalid_argument("LiveModel: enumeration attribute value needs an Enum definition");
    }
    claim_uuid(uuid);
    auto attr = std::make_shared<AttributeValue>();
    attr->uuid = uuid;
    attr->definition = std::move(definition);
    attr->values = std::move(values);
    item.attributes.push_back(attr);
    return attr;
}

// ============================================================================
// LiveModel queries
// ============================================================================

WorkItemPtr LiveModel::work_item_by_identifier(const Module& module, const RmIdentifier& identifier) const
{
    auto module_it = m_work_items.find(module.uuid);
    if (module_it == m_work_items.end())
    {
        return nullptr;
    }
    auto item_it = module_it->second.find(identifier);
    if (item_it == module_it->second.end())
    {
        return nullptr;
    }
    return item_it->second;
}

} // namespace reqsync
