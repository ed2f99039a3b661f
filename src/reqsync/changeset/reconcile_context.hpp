/**
 * @file reconcile_context.hpp
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reconcile_diagnostics.hpp"
#include "reqsync/changeset/reference_resolver.hpp"
#include "reqsync/changeset/value_validator.hpp"
#include "reqsync/model/req_finder.hpp"
#include "reqsync/snapshot/tracker_snapshot.hpp"

namespace reqsync
{

/**
 * @brief Inputs and collaborators shared by the reconcilers of one module.
 *
 * @details
 * Created by `TrackerChange` for a single calculation. All members refer to
 * objects that outlive the calculation; only `diagnostics` is written to.
 */
struct ReconcileContext
{
    const TrackerSnapshot& snapshot;
    const Module& module;

    /// The module's requirement types folder, or nullptr if it does not exist yet.
    const RequirementTypesFolder* types_folder;

    const ReqFinder& finder;
    const ReferenceResolver& resolver;
    const ValueValidator& validator;
    ReconcileDiagnostics& diagnostics;
};

} // namespace reqsync
