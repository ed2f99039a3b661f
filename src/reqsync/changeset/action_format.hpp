/**
 * @file action_format.hpp
 * @brief YAML rendering of values, references and actions.
 *
 * @details
 * The output is the document the action applier reads: references carry the
 * local tags `!uuid` and `!promise`, text is always double-quoted, and
 * timestamps are ISO 8601 in UTC. Rendering goes through yaml-cpp's emitter,
 * so arbitrary text (newlines, quotes, leading dashes) stays a single scalar.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/changeset/change_action.hpp"

namespace reqsync
{

/**
 * @brief Render a raw value, e.g. `"text"`, `42`, `["Open", "Closed"]`, `null`.
 */
std::string format_primitive(const Primitive& value);

/**
 * @brief Render a reference as `!uuid <uuid>` or `!promise <label>`.
 */
std::string format_reference(const Reference& ref);

/**
 * @brief Render one action as a YAML mapping with keys `parent`, `extend`,
 *        `modify` and `delete` (empty parts omitted).
 * @throw std::logic_error if the emitter rejects the document.
 */
std::string format_action(const ChangeAction& action);

/**
 * @brief Render a list of actions as a YAML sequence document.
 * @throw std::logic_error if the emitter rejects the document.
 */
std::string format_actions(const std::vector<ChangeActionPtr>& actions);

} // namespace reqsync
