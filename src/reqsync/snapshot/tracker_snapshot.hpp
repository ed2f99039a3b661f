/**
 * @file tracker_snapshot.hpp
 * @brief Desired state of one tracker module, as exported by the external tool.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/ordered_map.hpp"
#include "reqsync/common/reqsync_enums.hpp"

namespace reqsync
{

/**
 * @brief Attribute name to raw value, in snapshot order.
 */
using AttributeMap = OrderedMap<Primitive>;

/**
 * @brief Declared kind of one attribute of a requirement type.
 * @details `multi_valued` is only meaningful for `AttributeKind::Enum`.
 */
struct AttributeDefinitionSpec
{
    AttributeKind kind{AttributeKind::String};
    bool multi_valued{false};
};

/**
 * @brief A requirement type as declared by the snapshot.
 */
struct RequirementTypeSpec
{
    std::string long_name;
    OrderedMap<AttributeDefinitionSpec> attributes;
};

/**
 * @brief One node of the snapshot's work item tree.
 *
 * @details
 * Whether a node is a folder or a requirement is decided once, on
 * construction: a node is a folder if it has children or carries the
 * reserved `("Type", "Folder")` marker attribute. The marker is a hint only
 * and is never stored as an attribute value.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe.
 */
class WorkItemSpec
{
public:
    WorkItemSpec(RmIdentifier identifier,
                 std::string long_name,
                 std::optional<RmIdentifier> type = std::nullopt,
                 AttributeMap attributes = {},
                 std::vector<WorkItemSpec> children = {},
                 std::optional<std::string> text = std::nullopt);

    const RmIdentifier& identifier() const noexcept
    {
        return m_identifier;
    }

    const std::string& long_name() const noexcept
    {
        return m_long_name;
    }

    /// Free text; absent means "leave the live text as it is".
    const std::optional<std::string>& text() const noexcept
    {
        return m_text;
    }

    /// Requirement type identifier; absent or empty means untyped.
    const std::optional<RmIdentifier>& type() const noexcept
    {
        return m_type;
    }

    bool has_type() const noexcept
    {
        return m_type.has_value() && !m_type->empty();
    }

    const AttributeMap& attributes() const noexcept
    {
        return m_attributes;
    }

    const std::vector<WorkItemSpec>& children() const noexcept
    {
        return m_children;
    }

    ItemKind kind() const noexcept
    {
        return m_kind;
    }

    bool is_folder() const noexcept
    {
        return m_kind == ItemKind::Folder;
    }

private:
    RmIdentifier m_identifier;
    std::string m_long_name;
    std::optional<RmIdentifier> m_type;
    AttributeMap m_attributes;
    std::vector<WorkItemSpec> m_children;
    std::optional<std::string> m_text;
    ItemKind m_kind;
};

/**
 * @brief Snapshot of one tracker module.
 *
 * @details
 * By convention the data-type definition backing an Enum attribute is the
 * one named after the attribute.
 */
struct TrackerSnapshot
{
    /// Identifier of the tracker module; matched against `TrackerConfig::id`.
    std::string id;

    /// Data-type definition name to its ordered enumeration literals.
    OrderedMap<std::vector<std::string>> data_types;

    /// Requirement type identifier to its declaration.
    OrderedMap<RequirementTypeSpec> requirement_types;

    std::vector<WorkItemSpec> items;
};

/**
 * @brief Check whether an attribute is excluded from storage.
 *
 * @details
 * A scalar text value is blacklisted if the `(name, value)` pair is in the
 * blacklist; a list value is blacklisted if it is non-empty and every element
 * is. Null and non-text values are never blacklisted.
 */
bool is_blacklisted(const std::string& name, const Primitive& value);

/**
 * @brief Check whether an attribute marks its work item as a folder.
 */
bool is_folder_marker(const std::string& name, const Primitive& value);

} // namespace reqsync
