/**
 * @file reqsync_enums.hpp
 */
#pragma once
#include "reqsync/common/common.hpp"

namespace reqsync
{

// ============================================================================
// Identity type aliases
// ============================================================================

/**
 * @brief Type alias for persistent identities of live-graph entities.
 *
 * @details
 * `Uuid` is a type alias for `std::string`. This alias exists for clarity in
 * API signatures and documentation, not for compile-time type safety.
 */
using Uuid = std::string;

/**
 * @brief Type alias for identifiers supplied by the external tracker.
 *
 * @details
 * External identifiers are stable across runs and unique within one module.
 * They are never generated by this library, only carried over from the
 * snapshot.
 */
using RmIdentifier = std::string;

/**
 * @brief Point in time used for Date attribute values.
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief A raw attribute value as it appears in a snapshot or the live graph.
 *
 * @details
 * Alternatives, in order: null, boolean, integer, real, text, timestamp and
 * list of texts (enumeration literal names).
 *
 * @note Construct text values from `std::string`, never from a string literal:
 * a `const char*` converts to `bool` before it converts to `std::string`.
 */
using Primitive = std::variant<
    std::monostate,
    bool,
    std::int64_t,
    double,
    std::string,
    Timestamp,
    std::vector<std::string>>;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Kind of an attribute definition.
 *
 * @details
 * Each kind prescribes the shape of the values stored under it: String takes
 * text, Enum a list of literal names, Date a timestamp, Integer a whole
 * number, Float a real number and Boolean a boolean.
 */
enum class AttributeKind
{
    String,
    Enum,
    Date,
    Integer,
    Float,
    Boolean
};

/**
 * @brief Structural kind of a work item.
 *
 * @details
 * Folders own child folders and requirements; requirements are leaves.
 */
enum class ItemKind
{
    Requirement,
    Folder
};

/**
 * @brief Get the tag name of an attribute kind ("String", "Enum", ...).
 */
inline const char* to_string(AttributeKind kind) noexcept
{
    switch (kind)
    {
    case AttributeKind::String: return "String";
    case AttributeKind::Enum: return "Enum";
    case AttributeKind::Date: return "Date";
    case AttributeKind::Integer: return "Integer";
    case AttributeKind::Float: return "Float";
    case AttributeKind::Boolean: return "Boolean";
    }
    return "Unknown";
}

/**
 * @brief Get the slot name under which items of this kind are stored.
 * @return "folders" or "requirements".
 */
inline const char* slot_name(ItemKind kind) noexcept
{
    return kind == ItemKind::Folder ? "folders" : "requirements";
}

} // namespace reqsync
