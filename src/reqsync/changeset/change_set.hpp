/**
 * @file change_set.hpp
 * @brief Change-set calculation over all configured modules.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reconcile_diagnostics.hpp"
#include "reqsync/changeset/change_action.hpp"
#include "reqsync/changeset/tracker_change.hpp"

namespace reqsync
{

/**
 * @brief The set of synchronized trackers.
 */
struct SyncConfig
{
    std::vector<TrackerConfig> modules;
};

/**
 * @brief Result of a multi-module calculation.
 */
struct ChangeSet
{
    /// Actions of all successfully reconciled modules, in configuration order.
    std::vector<ChangeActionPtr> actions;

    /// Warnings of reconciled modules and one error per skipped module.
    ReconcileDiagnostics diagnostics;

    /// Tracker ids whose actions are contained in `actions`.
    std::vector<std::string> synchronized_modules;

    /**
     * @brief One-line summary, e.g. "2 modules synchronized, 1 skipped, 7 actions, 0 warnings".
     */
    std::string summary() const;
};

/**
 * @brief Calculate the change set of every configured module.
 *
 * @details
 * Modules are processed in configuration order, each against the snapshot
 * whose `id` equals the tracker's `id`. A module whose calculation fails with
 * a `ReqSyncError` (including a missing snapshot, reported as
 * `MissingSnapshot`) contributes no actions; the failure is recorded as an
 * error diagnostic with category `ModuleSkipped` and the remaining modules
 * are still processed.
 */
ChangeSet calculate_change_set(const LiveModel& model, const SyncConfig& config,
                               const std::vector<TrackerSnapshot>& snapshots);

} // namespace reqsync
