/**
 * @file type_system_reconciler.cpp
 */
#include "reqsync/changeset/type_system_reconciler.hpp"
#include "reqsync/changeset/action_assembler.hpp"

namespace reqsync
{

namespace
{

constexpr const char* kTypesFolderLongName = "Types";
constexpr const char* kTypesFolderIdentifier = "-2";

Primitive text(const std::string& value)
{
    return Primitive{value};
}

} // namespace

// ============================================================================
// Creation payloads
// ============================================================================

CreatePayloadPtr TypeSystemReconciler::types_folder_create_payload() const
{
    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = type_tag::kRequirementTypesFolder;
    payload->fields["long_name"] = text(kTypesFolderLongName);
    payload->fields["identifier"] = text(kTypesFolderIdentifier);

    for (const auto& [name, values] : m_ctx.snapshot.data_types)
    {
        payload->children["data_type_definitions"].push_back(data_type_definition_payload(name, values));
    }
    for (const auto& [identifier, spec] : m_ctx.snapshot.requirement_types)
    {
        payload->children["requirement_types"].push_back(requirement_type_payload(identifier, spec));
    }
    return payload;
}

CreatePayloadPtr TypeSystemReconciler::enum_value_payload(const std::string& data_type_name,
                                                          const std::string& value) const
{
    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = type_tag::kEnumValue;
    payload->promise_id = promise_label::enum_value(data_type_name, value);
    payload->fields["long_name"] = text(value);
    return payload;
}

CreatePayloadPtr TypeSystemReconciler::data_type_definition_payload(const std::string& name,
                                                                    const std::vector<std::string>& values) const
{
    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = type_tag::kDataTypeDefinition;
    payload->promise_id = promise_label::data_type_definition(name);
    payload->fields["long_name"] = text(name);
    for (const auto& value : values)
    {
        payload->children["values"].push_back(enum_value_payload(name, value));
    }
    return payload;
}

CreatePayloadPtr TypeSystemReconciler::requirement_type_payload(const RmIdentifier& identifier,
                                                                const RequirementTypeSpec& spec) const
{
    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = type_tag::kRequirementType;
    payload->promise_id = promise_label::requirement_type(identifier);
    payload->fields["identifier"] = text(identifier);
    payload->fields["long_name"] = text(spec.long_name);
    for (const auto& [name, adef_spec] : spec.attributes)
    {
        payload->children["attribute_definitions"].push_back(
            attribute_definition_payload(name, adef_spec, identifier));
    }
    return payload;
}

CreatePayloadPtr TypeSystemReconciler::attribute_definition_payload(const std::string& name,
                                                                    const AttributeDefinitionSpec& spec,
                                                                    const RmIdentifier& reqtype_identifier) const
{
    const std::string identifier = attribute_definition_identifier(name, reqtype_identifier);

    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = type_tag::attribute_definition(spec.kind);
    payload->promise_id = promise_label::attribute_definition(spec.kind, identifier);
    payload->fields["identifier"] = text(identifier);
    payload->fields["long_name"] = text(name);

    if (spec.kind == AttributeKind::Enum)
    {
        if (auto data_type = enum_data_type(name))
        {
            payload->fields["data_type"] = *data_type;
        }
        payload->fields["multi_valued"] = Primitive{spec.multi_valued};
    }
    else
    {
        payload->fields["kind"] = text(to_string(spec.kind));
    }
    return payload;
}

std::optional<Reference> TypeSystemReconciler::enum_data_type(const std::string& name) const
{
    if (!m_ctx.snapshot.data_types.contains(name))
    {
        m_ctx.diagnostics.warn(DiagnosticCategory::MissingDataTypeDefinition, name,
                               "Enum attribute '" + name + "' has no data type definition in the snapshot");
        return std::nullopt;
    }
    return m_ctx.resolver.data_type_definition(name);
}

// ============================================================================
// Modification of an existing folder
// ============================================================================

const RequirementTypesFolder& TypeSystemReconciler::folder() const
{
    if (m_ctx.types_folder == nullptr)
    {
        throw std::logic_error("TypeSystemReconciler: module " + m_ctx.module.uuid +
                               " has no requirement types folder");
    }
    return *m_ctx.types_folder;
}

std::vector<ChangeActionPtr> TypeSystemReconciler::actions() const
{
    std::vector<ChangeActionPtr> result = data_type_definition_actions();
    std::vector<ChangeActionPtr> reqtype_actions = requirement_type_actions();
    result.insert(result.end(), reqtype_actions.begin(), reqtype_actions.end());
    return result;
}

std::vector<ChangeActionPtr> TypeSystemReconciler::data_type_definition_actions() const
{
    const RequirementTypesFolder& types = folder();
    auto base = std::make_shared<ChangeAction>(Reference::concrete(types.uuid));
    std::vector<ChangeActionPtr> modifications;

    for (const auto& dtdef : types.data_type_definitions)
    {
        if (!m_ctx.snapshot.data_types.contains(dtdef->long_name))
        {
            base->deletions["data_type_definitions"].push_back(Reference::concrete(dtdef->uuid));
        }
    }

    for (const auto& [name, values] : m_ctx.snapshot.data_types)
    {
        auto dtdef = m_ctx.finder.data_type_definition_by_long_name(&types, name);
        if (!dtdef)
        {
            append_extend(*base, "data_type_definitions", data_type_definition_payload(name, values));
            continue;
        }
        modifications.push_back(data_type_definition_mod_action(*dtdef, name, values));
    }

    std::vector<ChangeActionPtr> result{base};
    result.insert(result.end(), modifications.begin(), modifications.end());
    prune_void_actions(result);
    return result;
}

ChangeActionPtr TypeSystemReconciler::data_type_definition_mod_action(const DataTypeDefinition& dtdef,
                                                                      const std::string& name,
                                                                      const std::vector<std::string>& values) const
{
    auto base = std::make_shared<ChangeAction>(Reference::concrete(dtdef.uuid));
    if (dtdef.long_name != name)
    {
        set_modify(*base, "long_name", text(name));
    }

    for (const auto& value : values)
    {
        if (!dtdef.value_by_long_name(value))
        {
            append_extend(*base, "values", enum_value_payload(name, value));
        }
    }

    for (const auto& literal : dtdef.values)
    {
        if (std::find(values.begin(), values.end(), literal->long_name) == values.end())
        {
            base->deletions["values"].push_back(Reference::concrete(literal->uuid));
        }
    }
    return base;
}

std::vector<ChangeActionPtr> TypeSystemReconciler::requirement_type_actions() const
{
    const RequirementTypesFolder& types = folder();
    auto base = std::make_shared<ChangeAction>(Reference::concrete(types.uuid));
    std::vector<ChangeActionPtr> modifications;

    for (const auto& reqtype : types.requirement_types)
    {
        if (!m_ctx.snapshot.requirement_types.contains(reqtype->identifier))
        {
            base->deletions["requirement_types"].push_back(Reference::concrete(reqtype->uuid));
        }
    }

    for (const auto& [identifier, spec] : m_ctx.snapshot.requirement_types)
    {
        auto reqtype = m_ctx.finder.reqtype_by_identifier(&types, identifier);
        if (!reqtype)
        {
            append_extend(*base, "requirement_types", requirement_type_payload(identifier, spec));
            continue;
        }
        requirement_type_mod_actions(*reqtype, spec, modifications);
    }

    std::vector<ChangeActionPtr> result{base};
    result.insert(result.end(), modifications.begin(), modifications.end());
    prune_void_actions(result);
    return result;
}

void TypeSystemReconciler::requirement_type_mod_actions(const RequirementType& reqtype,
                                                        const RequirementTypeSpec& spec,
                                                        std::vector<ChangeActionPtr>& out) const
{
    auto base = std::make_shared<ChangeAction>(Reference::concrete(reqtype.uuid));
    std::vector<ChangeActionPtr> modifications;

    if (reqtype.long_name != spec.long_name)
    {
        set_modify(*base, "long_name", text(spec.long_name));
    }

    for (const auto& adef : reqtype.attribute_definitions)
    {
        const AttributeDefinitionSpec* adef_spec = spec.attributes.find(adef->long_name);
        if (adef_spec == nullptr || adef_spec->kind != adef->kind)
        {
            base->deletions["attribute_definitions"].push_back(Reference::concrete(adef->uuid));
        }
    }

    for (const auto& [name, adef_spec] : spec.attributes)
    {
        auto adef = reqtype.attribute_definition_by_long_name(name);
        if (adef && adef->kind != adef_spec.kind)
        {
            m_ctx.diagnostics.warn(
                DiagnosticCategory::AttributeKindChanged, adef->identifier,
                "Attribute definition '" + adef->identifier + "' changes kind from " +
                    to_string(adef->kind) + " to " + to_string(adef_spec.kind) + "; it is recreated");
            adef = nullptr;
        }

        if (!adef)
        {
            append_extend(*base, "attribute_definitions",
                          attribute_definition_payload(name, adef_spec, reqtype.identifier));
            continue;
        }
        modifications.push_back(attribute_definition_mod_action(*adef, name, adef_spec));
    }

    out.push_back(base);
    out.insert(out.end(), modifications.begin(), modifications.end());
}

ChangeActionPtr TypeSystemReconciler::attribute_definition_mod_action(const AttributeDefinition& adef,
                                                                      const std::string& name,
                                                                      const AttributeDefinitionSpec& spec) const
{
    auto base = std::make_shared<ChangeAction>(Reference::concrete(adef.uuid));
    if (adef.long_name != name)
    {
        set_modify(*base, "long_name", text(name));
    }

    if (spec.kind == AttributeKind::Enum)
    {
        if (!adef.data_type || adef.data_type->long_name != name)
        {
            if (auto data_type = enum_data_type(name))
            {
                set_modify(*base, "data_type", *data_type);
            }
        }
        if (adef.multi_valued != spec.multi_valued)
        {
            set_modify(*base, "multi_valued", Primitive{spec.multi_valued});
        }
    }
    return base;
}

} // namespace reqsync
