/**
 * @file reference.cpp
 */
#include "reqsync/changeset/reference.hpp"

namespace reqsync
{

namespace type_tag
{

const char* attribute_definition(AttributeKind kind) noexcept
{
    return kind == AttributeKind::Enum ? kAttributeDefinitionEnumeration : kAttributeDefinition;
}

const char* attribute_value(AttributeKind kind) noexcept
{
    switch (kind)
    {
    case AttributeKind::String: return "StringValueAttribute";
    case AttributeKind::Enum: return "EnumerationValueAttribute";
    case AttributeKind::Date: return "DateValueAttribute";
    case AttributeKind::Integer: return "IntegerValueAttribute";
    case AttributeKind::Float: return "RealValueAttribute";
    case AttributeKind::Boolean: return "BooleanValueAttribute";
    }
    return "AttributeValue";
}

const char* work_item(ItemKind kind) noexcept
{
    return kind == ItemKind::Folder ? kRequirementsFolder : kRequirement;
}

} // namespace type_tag

namespace promise_label
{

std::string data_type_definition(const std::string& name)
{
    return std::string(type_tag::kDataTypeDefinition) + " " + name;
}

std::string enum_value(const std::string& data_type_name, const std::string& value)
{
    return std::string(type_tag::kEnumValue) + " " + data_type_name + " " + value;
}

std::string requirement_type(const RmIdentifier& identifier)
{
    return std::string(type_tag::kRequirementType) + " " + identifier;
}

std::string attribute_definition(AttributeKind kind, const std::string& attribute_definition_identifier)
{
    return std::string(type_tag::attribute_definition(kind)) + " " + attribute_definition_identifier;
}

} // namespace promise_label

} // namespace reqsync
