/**
 * @file value_validator.hpp
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reqsync_exceptions.hpp"
#include "reqsync/snapshot/tracker_snapshot.hpp"

namespace reqsync
{

/**
 * @brief Outcome of a successful attribute value check.
 */
struct ValidatedValue
{
    AttributeKind kind;

    /// Storage key of the value: "values" for Enum, "value" otherwise.
    std::string key;

    Primitive value;
};

/**
 * @brief Checks snapshot attribute values against their declared kinds.
 *
 * @details
 * Each kind prescribes exactly one `Primitive` alternative (String: text,
 * Enum: list of texts, Date: timestamp, Integer: integer, Float: real,
 * Boolean: boolean). No conversions are applied: an integer is not a valid
 * Float value and a boolean is not a valid Integer value. Null never
 * validates.
 *
 * An Enum value must additionally name at least one literal declared for the
 * data-type definition named after the attribute.
 *
 * @par Thread safety
 * - Stateless apart from a const reference to the snapshot.
 */
class ValueValidator
{
public:
    explicit ValueValidator(const TrackerSnapshot& snapshot)
        : m_snapshot(snapshot)
    {
    }

    /**
     * @brief Validate one attribute value.
     * @param name The attribute name.
     * @param value The raw snapshot value.
     * @param reqtype The requirement type that declares the attribute.
     * @return The kind, storage key and value.
     * @throw InvalidFieldValueError if the attribute is not declared by
     *        `reqtype`, the value has the wrong shape, or no listed literal
     *        is a declared option.
     */
    ValidatedValue validate(const std::string& name, const Primitive& value,
                            const RequirementTypeSpec& reqtype) const;

    /**
     * @brief Declared literals of the data-type definition backing an Enum attribute.
     * @return The literals, or nullptr if the snapshot declares no such definition.
     */
    const std::vector<std::string>* enum_options(const std::string& name) const
    {
        return m_snapshot.data_types.find(name);
    }

private:
    const TrackerSnapshot& m_snapshot;
};

/**
 * @brief Check whether a value has the shape prescribed for a kind.
 */
bool matches_kind(AttributeKind kind, const Primitive& value) noexcept;

} // namespace reqsync
