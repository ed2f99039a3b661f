/**
 * @file reference.hpp
 * @brief References from change actions to live or promised entities.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reqsync_enums.hpp"

namespace reqsync
{

/**
 * @brief Discriminator of a `Reference`.
 */
enum class ReferenceKind
{
    Concrete,  ///< Points at an existing live entity by uuid.
    Promise    ///< Points at an entity created elsewhere in the same batch.
};

/**
 * @brief A reference to an entity from inside a change action.
 *
 * @details
 * A concrete reference carries the uuid of a live entity. A promise carries a
 * label; the applier resolves it against the creation in the same batch whose
 * `CreatePayload::promise_id` equals that label. Labels are derived with the
 * functions in `reqsync::promise_label`, so that the creation and every
 * reference to it agree without coordination.
 *
 * @par Value semantics
 * - Copyable, comparable and ordered (by kind, then key).
 */
class Reference
{
public:
    static Reference concrete(Uuid uuid)
    {
        return Reference(ReferenceKind::Concrete, std::move(uuid));
    }

    static Reference promise(std::string label)
    {
        return Reference(ReferenceKind::Promise, std::move(label));
    }

    ReferenceKind kind() const noexcept
    {
        return m_kind;
    }

    bool is_concrete() const noexcept
    {
        return m_kind == ReferenceKind::Concrete;
    }

    bool is_promise() const noexcept
    {
        return m_kind == ReferenceKind::Promise;
    }

    /**
     * @brief The uuid of a concrete reference, or the label of a promise.
     */
    const std::string& key() const noexcept
    {
        return m_key;
    }

    bool operator==(const Reference& other) const noexcept
    {
        return m_kind == other.m_kind && m_key == other.m_key;
    }

    bool operator!=(const Reference& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const Reference& other) const noexcept
    {
        if (m_kind != other.m_kind)
        {
            return m_kind < other.m_kind;
        }
        return m_key < other.m_key;
    }

private:
    Reference(ReferenceKind kind, std::string key)
        : m_kind(kind)
        , m_key(std::move(key))
    {
    }

private:
    ReferenceKind m_kind;
    std::string m_key;
};

// ============================================================================
// Entity type tags
// ============================================================================

/**
 * @brief Type tags of created entities, as understood by the applier.
 */
namespace type_tag
{
inline constexpr const char* kRequirementTypesFolder = "RequirementsTypesFolder";
inline constexpr const char* kDataTypeDefinition = "EnumerationDataTypeDefinition";
inline constexpr const char* kEnumValue = "EnumValue";
inline constexpr const char* kRequirementType = "RequirementType";
inline constexpr const char* kAttributeDefinition = "AttributeDefinition";
inline constexpr const char* kAttributeDefinitionEnumeration = "AttributeDefinitionEnumeration";
inline constexpr const char* kRequirementsFolder = "RequirementsFolder";
inline constexpr const char* kRequirement = "Requirement";

/// Attribute definition tag for a kind: the Enumeration tag for Enum, the plain one otherwise.
const char* attribute_definition(AttributeKind kind) noexcept;

/// Attribute value tag for a kind, e.g. "StringValueAttribute".
const char* attribute_value(AttributeKind kind) noexcept;

/// Work item tag for a kind: "RequirementsFolder" or "Requirement".
const char* work_item(ItemKind kind) noexcept;
} // namespace type_tag

// ============================================================================
// Promise labels
// ============================================================================

/**
 * @brief Deterministic labels of entities that may be created in a batch.
 *
 * @details
 * Each label is the entity's type tag followed by its scoping keys, separated
 * by single spaces.
 */
namespace promise_label
{
std::string data_type_definition(const std::string& name);
std::string enum_value(const std::string& data_type_name, const std::string& value);
std::string requirement_type(const RmIdentifier& identifier);
std::string attribute_definition(AttributeKind kind, const std::string& attribute_definition_identifier);
} // namespace promise_label

} // namespace reqsync
