/**
 * @file action_assembler.hpp
 * @brief Merging of action fragments and pruning of void actions.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/changeset/change_action.hpp"

namespace reqsync
{

/**
 * @brief Deep-merge a fragment into a target action in place.
 *
 * @details
 * The `extend`, `modify` and `deletions` maps of `fragment` are merged key by
 * key into those of `target`. A slot or field present in both is
 * overwritten by the fragment's value, except for `AttributeChanges` values,
 * which are themselves merged key by key. Empty maps in the fragment change
 * nothing. The fragment's parent is ignored.
 *
 * Merging the same fragment twice yields the same result as merging it once.
 */
void deep_merge(ChangeAction& target, const ChangeAction& fragment);

/**
 * @brief Append one entry to an extend slot of an action, creating the slot if needed.
 */
void append_extend(ChangeAction& target, const std::string& slot, ExtendEntry entry);

/**
 * @brief Set a modification, merging nested attribute changes.
 */
void set_modify(ChangeAction& target, const std::string& field, FieldValue value);

/**
 * @brief Remove void actions, keeping the order of the others.
 * @return The number of actions removed.
 */
std::size_t prune_void_actions(std::vector<ChangeActionPtr>& actions);

} // namespace reqsync
