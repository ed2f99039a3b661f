/**
 * @file tracker_change.hpp
 * @brief Change-set calculation for one tracker module.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reconcile_diagnostics.hpp"
#include "reqsync/common/reqsync_exceptions.hpp"
#include "reqsync/changeset/change_action.hpp"
#include "reqsync/model/live_model.hpp"
#include "reqsync/model/req_finder.hpp"
#include "reqsync/snapshot/tracker_snapshot.hpp"

namespace reqsync
{

/**
 * @brief Configuration of one synchronized tracker.
 */
struct TrackerConfig
{
    /// Identifier of the tracker; matched against `TrackerSnapshot::id`.
    std::string id;

    /// Uuid of the live module the tracker is synchronized into. Required.
    std::optional<Uuid> uuid;

    /// Identifier of the module in the external system, used as a lookup fallback.
    std::optional<RmIdentifier> external_id;
};

/**
 * @brief Calculates the actions that align one live module with its snapshot.
 *
 * @details
 * The calculation is a pure function of the live model, the snapshot and the
 * configuration; the live model is never modified.
 *
 * @par Action order
 * 1. Type-system actions (see `TypeSystemReconciler`). If the module has no
 *    requirement types folder, its creation is part of the module action
 *    instead.
 * 2. Work item actions, top-level items in snapshot order, each followed by
 *    its subtree.
 * 3. The module action: creations and moves of top-level items, then
 *    deletions of top-level items the snapshot no longer lists.
 * Void actions are omitted.
 *
 * @par Errors
 * - `ReqSyncError` (`InvalidTrackerConfig`) from the constructor if the
 *   configuration names no module uuid.
 * - `ReqSyncError` (`MissingTargetModule`) from the constructor if the module
 *   cannot be found.
 * - `InvalidFieldValueError` from `calculate_change()` if a snapshot value
 *   fails validation. No partial result is produced.
 * - `ReqSyncError` (`AmbiguousLabel`) from `calculate_change()` if two
 *   snapshot entities derive the same promise label or attribute definition
 *   identifier.
 *
 * @par Thread safety
 * - No internal synchronization. Distinct instances over the same unchanged
 *   model may be used concurrently.
 */
class TrackerChange
{
public:
    TrackerChange(const TrackerSnapshot& snapshot, const LiveModel& model, TrackerConfig config);

    /**
     * @brief Calculate the ordered action list.
     * @details Diagnostics of a previous calculation are discarded.
     */
    std::vector<ChangeActionPtr> calculate_change();

    /**
     * @brief Warnings collected by the last calculation.
     */
    const ReconcileDiagnostics& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const Module& module() const noexcept
    {
        return *m_module;
    }

    const TrackerConfig& config() const noexcept
    {
        return m_config;
    }

private:
    const TrackerSnapshot& m_snapshot;
    ReqFinder m_finder;
    TrackerConfig m_config;
    ModulePtr m_module;
    ReconcileDiagnostics m_diagnostics;
};

} // namespace reqsync
