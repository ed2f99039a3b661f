/**
 * @file change_set.cpp
 */
#include "reqsync/changeset/change_set.hpp"

namespace reqsync
{

namespace
{

const TrackerSnapshot& snapshot_for(const TrackerConfig& tracker, const std::vector<TrackerSnapshot>& snapshots)
{
    auto it = std::find_if(snapshots.begin(), snapshots.end(),
                           [&tracker](const TrackerSnapshot& snapshot) { return snapshot.id == tracker.id; });
    if (it == snapshots.end())
    {
        throw ReqSyncError(ReqSyncErrorCode::MissingSnapshot, "No snapshot found for tracker " + tracker.id);
    }
    return *it;
}

} // namespace

std::string ChangeSet::summary() const
{
    return std::to_string(synchronized_modules.size()) + " modules synchronized, " +
           std::to_string(diagnostics.errors().size()) + " skipped, " + std::to_string(actions.size()) +
           " actions, " + std::to_string(diagnostics.warnings().size()) + " warnings";
}

ChangeSet calculate_change_set(const LiveModel& model, const SyncConfig& config,
                               const std::vector<TrackerSnapshot>& snapshots)
{
    ChangeSet result;
    for (const auto& tracker : config.modules)
    {
        try
        {
            const TrackerSnapshot& snapshot = snapshot_for(tracker, snapshots);
            TrackerChange change(snapshot, model, tracker);
            std::vector<ChangeActionPtr> actions = change.calculate_change();

            result.actions.insert(result.actions.end(), actions.begin(), actions.end());
            result.diagnostics.absorb(change.diagnostics());
            result.synchronized_modules.push_back(tracker.id);
        }
        catch (const ReqSyncError& e)
        {
            result.diagnostics.error(DiagnosticCategory::ModuleSkipped, tracker.id,
                                     "Skipped synchronization for tracker " + tracker.id + ": " + e.what());
        }
    }
    return result;
}

} // namespace reqsync
