/**
 * @file change_action.hpp
 * @brief Declarative create/modify/delete actions produced by the change-set calculation.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reqsync_enums.hpp"
#include "reqsync/changeset/reference.hpp"

namespace reqsync
{

struct CreatePayload;
struct ChangeAction;

using CreatePayloadPtr = std::shared_ptr<CreatePayload>;
using ChangeActionPtr = std::shared_ptr<ChangeAction>;

/**
 * @brief Changed attribute value: a scalar, or literal references for Enum attributes.
 */
using AttributeChange = std::variant<Primitive, std::vector<Reference>>;

/**
 * @brief Attribute name to its new value, under `modify["attributes"]`.
 */
using AttributeChanges = std::map<std::string, AttributeChange>;

/**
 * @brief Value of a created field or of a modification.
 *
 * @details
 * Alternatives: a raw value, a single reference (e.g. `type`, `definition`,
 * `data_type`), a list of references (`values` of an Enum attribute value),
 * or the nested attribute changes of a work item.
 */
using FieldValue = std::variant<Primitive, Reference, std::vector<Reference>, AttributeChanges>;

/**
 * @brief An element of an extend slot: a new entity, or an existing/promised one being moved in.
 */
using ExtendEntry = std::variant<CreatePayloadPtr, Reference>;

using SlotEntries = std::vector<ExtendEntry>;

/// Slot name (e.g. "requirements", "values") to the entries added to it.
using ExtendMap = std::map<std::string, SlotEntries>;

/// Field name to new value.
using ModifyMap = std::map<std::string, FieldValue>;

/// Slot name to the entities removed from it.
using DeleteMap = std::map<std::string, std::vector<Reference>>;

// ============================================================================
// CreatePayload
// ============================================================================

/**
 * @brief Description of one entity to be created, with its nested creations.
 *
 * @details
 * If `promise_id` is non-empty, the creation declares that label and every
 * `Reference::promise()` with the same label in the batch refers to it.
 *
 * @par Ownership
 * - Nested creations are held through `std::shared_ptr`; copying a payload
 *   shares its children. Use `operator==` for deep comparison.
 */
struct CreatePayload
{
    std::string type_name;
    std::string promise_id;
    ModifyMap fields;
    ExtendMap children;

    /**
     * @brief Get a field value, or nullptr if the field is not set.
     */
    const FieldValue* field(const std::string& name) const;

    /**
     * @brief Get a child slot, or nullptr if the slot is empty.
     */
    const SlotEntries* slot(const std::string& name) const;
};

bool operator==(const CreatePayload& lhs, const CreatePayload& rhs);
bool operator!=(const CreatePayload& lhs, const CreatePayload& rhs);

/**
 * @brief Deep comparison of two extend entries (payloads are compared by content).
 */
bool entries_equal(const ExtendEntry& lhs, const ExtendEntry& rhs);

// ============================================================================
// ChangeAction
// ============================================================================

/**
 * @brief A declarative change of one live (or promised) parent entity.
 *
 * @details
 * An action whose `extend`, `modify` and `deletions` are all empty is void and
 * never appears in a final action list.
 *
 * @par Thread safety
 * - No internal synchronization. Actions are mutated while the change set is
 *   being calculated and treated as immutable afterwards.
 */
struct ChangeAction
{
    explicit ChangeAction(Reference parent_ref)
        : parent(std::move(parent_ref))
    {
    }

    Reference parent;
    ExtendMap extend;
    ModifyMap modify;
    DeleteMap deletions;

    bool is_void() const noexcept
    {
        return extend.empty() && modify.empty() && deletions.empty();
    }
};

bool operator==(const ChangeAction& lhs, const ChangeAction& rhs);
bool operator!=(const ChangeAction& lhs, const ChangeAction& rhs);

} // namespace reqsync
