/**
 * @file reference_resolver.cpp
 */
#include "reqsync/changeset/reference_resolver.hpp"

namespace reqsync
{

Reference ReferenceResolver::data_type_definition(const std::string& name) const
{
    auto dtdef = m_finder.data_type_definition_by_long_name(m_types_folder, name);
    if (dtdef)
    {
        return Reference::concrete(dtdef->uuid);
    }
    return Reference::promise(promise_label::data_type_definition(name));
}

Reference ReferenceResolver::enum_value(const std::string& data_type_name, const std::string& value) const
{
    auto dtdef = m_finder.data_type_definition_by_long_name(m_types_folder, data_type_name);
    auto literal = m_finder.enum_value_by_long_name(dtdef.get(), value);
    if (literal)
    {
        return Reference::concrete(literal->uuid);
    }
    return Reference::promise(promise_label::enum_value(data_type_name, value));
}

Reference ReferenceResolver::requirement_type(const RmIdentifier& identifier) const
{
    auto reqtype = m_finder.reqtype_by_identifier(m_types_folder, identifier);
    if (reqtype)
    {
        return Reference::concrete(reqtype->uuid);
    }
    return Reference::promise(promise_label::requirement_type(identifier));
}

Reference ReferenceResolver::attribute_definition(const std::string& name, const RmIdentifier& reqtype_identifier,
                                                  AttributeKind kind) const
{
    const std::string identifier = attribute_definition_identifier(name, reqtype_identifier);
    auto adef = m_finder.attribute_definition_by_identifier(
        m_types_folder, kind == AttributeKind::Enum, identifier);
    if (adef && adef->kind == kind)
    {
        return Reference::concrete(adef->uuid);
    }
    return Reference::promise(promise_label::attribute_definition(kind, identifier));
}

} // namespace reqsync
