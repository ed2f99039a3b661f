/**
 * @file value_validator.cpp
 */
#include "reqsync/changeset/value_validator.hpp"
#include "reqsync/changeset/action_format.hpp"

namespace reqsync
{

namespace
{

template <typename T, typename Variant, std::size_t I = 0>
constexpr std::size_t alternative_index()
{
    static_assert(I < std::variant_size_v<Variant>, "type is not an alternative of the variant");
    if constexpr (std::is_same_v<std::variant_alternative_t<I, Variant>, T>)
    {
        return I;
    }
    else
    {
        return alternative_index<T, Variant, I + 1>();
    }
}

/**
 * @brief Expected shape and storage key per attribute kind.
 */
struct KindShape
{
    AttributeKind kind;
    std::size_t alternative;
    const char* key;
};

constexpr KindShape kKindShapes[] = {
    {AttributeKind::String, alternative_index<std::string, Primitive>(), "value"},
    {AttributeKind::Enum, alternative_index<std::vector<std::string>, Primitive>(), "values"},
    {AttributeKind::Date, alternative_index<Timestamp, Primitive>(), "value"},
    {AttributeKind::Integer, alternative_index<std::int64_t, Primitive>(), "value"},
    {AttributeKind::Float, alternative_index<double, Primitive>(), "value"},
    {AttributeKind::Boolean, alternative_index<bool, Primitive>(), "value"},
};

const KindShape& shape_of(AttributeKind kind) noexcept
{
    for (const auto& shape : kKindShapes)
    {
        if (shape.kind == kind)
        {
            return shape;
        }
    }
    return kKindShapes[0];
}

[[noreturn]] void throw_invalid(const std::string& name, const Primitive& value, const std::string& reason)
{
    throw InvalidFieldValueError(
        name, value,
        "Broken snapshot: Invalid field value " + format_primitive(value) + " for " + name + ": " + reason);
}

} // namespace

bool matches_kind(AttributeKind kind, const Primitive& value) noexcept
{
    return value.index() == shape_of(kind).alternative;
}

ValidatedValue ValueValidator::validate(const std::string& name, const Primitive& value,
                                        const RequirementTypeSpec& reqtype) const
{
    const AttributeDefinitionSpec* adef = reqtype.attributes.find(name);
    if (adef == nullptr)
    {
        throw_invalid(name, value, "attribute is not declared by requirement type " + reqtype.long_name);
    }

    const KindShape& shape = shape_of(adef->kind);
    if (!matches_kind(adef->kind, value))
    {
        throw_invalid(name, value, std::string("expected a ") + to_string(adef->kind) + " value");
    }

    if (adef->kind == AttributeKind::Enum)
    {
        const auto* options = enum_options(name);
        if (options == nullptr)
        {
            throw_invalid(name, value, "no data type definition declares its options");
        }
        const auto& literals = std::get<std::vector<std::string>>(value);
        bool any_declared = std::any_of(literals.begin(), literals.end(), [options](const std::string& literal) {
            return std::find(options->begin(), options->end(), literal) != options->end();
        });
        if (!any_declared)
        {
            throw_invalid(name, value, "none of the literals is a declared option");
        }
    }

    return ValidatedValue{adef->kind, shape.key, value};
}

} // namespace reqsync
