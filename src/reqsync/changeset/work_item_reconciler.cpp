/**
 * @file work_item_reconciler.cpp
 */
#include "reqsync/changeset/work_item_reconciler.hpp"
#include "reqsync/changeset/action_assembler.hpp"

namespace reqsync
{

bool has_stored_attributes(const WorkItemSpec& spec)
{
    return std::any_of(spec.attributes().begin(), spec.attributes().end(),
                       [](const auto& entry) { return !is_blacklisted(entry.first, entry.second); });
}

// ============================================================================
// Creation
// ============================================================================

CreatePayloadPtr WorkItemReconciler::create_payload(const WorkItemSpec& spec, std::vector<ChangeActionPtr>& out)
{
    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = type_tag::work_item(spec.kind());
    payload->fields["long_name"] = Primitive{spec.long_name()};
    payload->fields["identifier"] = Primitive{spec.identifier()};
    if (spec.text() && !spec.text()->empty())
    {
        payload->fields["text"] = Primitive{*spec.text()};
    }

    const RequirementTypeSpec* scope = attribute_scope(spec);
    if (scope != nullptr)
    {
        payload->fields["type"] = m_ctx.resolver.requirement_type(*spec.type());
        for (const auto& [name, value] : spec.attributes())
        {
            if (is_blacklisted(name, value) || !scope->attributes.contains(name))
            {
                continue;
            }
            payload->children["attributes"].push_back(attribute_value_payload(name, value, *spec.type(), *scope));
        }
    }

    for (const auto& child : spec.children())
    {
        auto live_child = m_ctx.finder.work_item_by_identifier(m_ctx.module, child.identifier());
        if (!live_child)
        {
            payload->children[slot_name(child.kind())].push_back(create_payload(child, out));
            continue;
        }
        payload->children[slot_name(live_child->kind)].push_back(Reference::concrete(live_child->uuid));
        modify(*live_child, child, nullptr, out);
    }
    return payload;
}

CreatePayloadPtr WorkItemReconciler::attribute_value_payload(const std::string& name, const Primitive& value,
                                                             const RmIdentifier& reqtype_identifier,
                                                             const RequirementTypeSpec& reqtype)
{
    ValidatedValue validated = m_ctx.validator.validate(name, value, reqtype);

    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = type_tag::attribute_value(validated.kind);
    payload->fields["definition"] = m_ctx.resolver.attribute_definition(name, reqtype_identifier, validated.kind);
    if (validated.kind == AttributeKind::Enum)
    {
        const auto& literals = std::get<std::vector<std::string>>(validated.value);
        payload->fields[validated.key] = enum_value_references(name, literals);
    }
    else
    {
        payload->fields[validated.key] = validated.value;
    }
    return payload;
}

std::vector<Reference> WorkItemReconciler::enum_value_references(const std::string& name,
                                                                 const std::vector<std::string>& literals)
{
    const std::vector<std::string>* options = m_ctx.validator.enum_options(name);
    std::vector<Reference> refs;
    for (const auto& literal : literals)
    {
        if (options == nullptr || std::find(options->begin(), options->end(), literal) == options->end())
        {
            m_ctx.diagnostics.warn(DiagnosticCategory::UnknownEnumLiteral, name,
                                   "Literal '" + literal + "' is not a declared option of " + name + "; skipped");
            continue;
        }
        refs.push_back(m_ctx.resolver.enum_value(name, literal));
    }
    return refs;
}

// ============================================================================
// Type and attribute scope
// ============================================================================

const RequirementTypeSpec* WorkItemReconciler::attribute_scope(const WorkItemSpec& spec) const
{
    if (!spec.has_type())
    {
        if (has_stored_attributes(spec))
        {
            m_ctx.diagnostics.warn(DiagnosticCategory::AttributesWithoutType, spec.identifier(),
                                   "Requirement without type but with attributes found: " + spec.identifier());
        }
        return nullptr;
    }

    const RequirementTypeSpec* reqtype = m_ctx.snapshot.requirement_types.find(*spec.type());
    if (reqtype == nullptr)
    {
        m_ctx.diagnostics.warn(DiagnosticCategory::UnknownRequirementType, spec.identifier(),
                               "Faulty requirement in snapshot: unknown requirement type '" + *spec.type() + "'");
    }
    return reqtype;
}

bool WorkItemReconciler::attributes_abandoned(const WorkItemSpec& spec, const RequirementTypeSpec* scope) const
{
    if (scope != nullptr)
    {
        return false;
    }
    return spec.has_type() || has_stored_attributes(spec);
}

// ============================================================================
// Modification
// ============================================================================

void WorkItemReconciler::modify(const WorkItem& live, const WorkItemSpec& spec, const ItemContainer* expected_parent,
                                std::vector<ChangeActionPtr>& out)
{
    auto base = std::make_shared<ChangeAction>(Reference::concrete(live.uuid));
    out.push_back(base);

    if (live.long_name != spec.long_name())
    {
        set_modify(*base, "long_name", Primitive{spec.long_name()});
    }
    if (spec.text() && live.text != *spec.text())
    {
        set_modify(*base, "text", Primitive{*spec.text()});
    }

    const RequirementTypeSpec* scope = attribute_scope(spec);
    diff_type(live, spec, *base);
    if (!attributes_abandoned(spec, scope))
    {
        diff_attributes(live, spec, scope, *base);
    }

    if (live.parent != expected_parent)
    {
        m_ledger.mark_relocated(live.identifier);
        m_ledger.retract(live);
    }

    if (live.is_folder())
    {
        reconcile_children(live, spec, base, out);
    }
    else if (!spec.children().empty())
    {
        m_ctx.diagnostics.warn(DiagnosticCategory::ItemKindChanged, spec.identifier(),
                               "Work item " + spec.identifier() + " is a requirement but has children in the snapshot");
    }
}

void WorkItemReconciler::diff_type(const WorkItem& live, const WorkItemSpec& spec, ChangeAction& action) const
{
    if (!spec.has_type())
    {
        if (live.type)
        {
            set_modify(action, "type", Primitive{});
        }
        return;
    }

    const RmIdentifier& identifier = *spec.type();
    if (!m_ctx.snapshot.requirement_types.contains(identifier))
    {
        return;
    }
    if (!live.type || live.type->identifier != identifier)
    {
        set_modify(action, "type", m_ctx.resolver.requirement_type(identifier));
    }
}

void WorkItemReconciler::diff_attributes(const WorkItem& live, const WorkItemSpec& spec,
                                         const RequirementTypeSpec* scope, ChangeAction& action)
{
    std::unordered_set<Uuid> kept;
    AttributeChanges changes;

    if (scope != nullptr)
    {
        const RmIdentifier& reqtype_identifier = *spec.type();
        for (const auto& [name, value] : spec.attributes())
        {
            if (is_blacklisted(name, value) || !scope->attributes.contains(name))
            {
                continue;
            }

            ValidatedValue validated = m_ctx.validator.validate(name, value, *scope);
            const std::string identifier = attribute_definition_identifier(name, reqtype_identifier);
            auto attr_it = std::find_if(live.attributes.begin(), live.attributes.end(), [&](const auto& attr) {
                return attr->definition && attr->definition->identifier == identifier &&
                       attr->definition->kind == validated.kind;
            });

            if (attr_it == live.attributes.end())
            {
                append_extend(action, "attributes", attribute_value_payload(name, value, reqtype_identifier, *scope));
                continue;
            }

            const AttributeValue& attr = **attr_it;
            kept.insert(attr.uuid);
            if (validated.kind == AttributeKind::Enum)
            {
                std::vector<Reference> refs =
                    enum_value_references(name, std::get<std::vector<std::string>>(validated.value));
                std::vector<Reference> live_refs;
                for (const auto& literal : attr.values)
                {
                    live_refs.push_back(Reference::concrete(literal->uuid));
                }
                if (std::set<Reference>(refs.begin(), refs.end()) !=
                    std::set<Reference>(live_refs.begin(), live_refs.end()))
                {
                    changes[name] = refs;
                }
            }
            else if (attr.value != validated.value)
            {
                changes[name] = validated.value;
            }
        }
    }

    set_modify(action, "attributes", changes);

    for (const auto& attr : live.attributes)
    {
        if (kept.count(attr->uuid) == 0)
        {
            action.deletions["attributes"].push_back(Reference::concrete(attr->uuid));
        }
    }
}

void WorkItemReconciler::reconcile_children(const WorkItem& live, const WorkItemSpec& spec,
                                            const ChangeActionPtr& action, std::vector<ChangeActionPtr>& out)
{
    std::unordered_set<RmIdentifier> visited;
    for (const auto& child : spec.children())
    {
        visited.insert(child.identifier());
        auto live_child = m_ctx.finder.work_item_by_identifier(m_ctx.module, child.identifier());
        if (!live_child)
        {
            append_extend(*action, slot_name(child.kind()), create_payload(child, out));
            continue;
        }
        if (live_child->parent != &live)
        {
            append_extend(*action, slot_name(live_child->kind), Reference::concrete(live_child->uuid));
        }
        modify(*live_child, child, &live, out);
    }

    ChangeAction deletions(action->parent);
    for (const auto* children : {&live.folders, &live.requirements})
    {
        for (const auto& child : *children)
        {
            if (visited.count(child->identifier) != 0 || m_ledger.is_relocated(child->identifier))
            {
                continue;
            }
            deletions.deletions[slot_name(child->kind)].push_back(Reference::concrete(child->uuid));
            m_ledger.propose(*child, action);
        }
    }
    // Merged before any later relocation can retract one of the proposals.
    deep_merge(*action, deletions);
}

} // namespace reqsync
