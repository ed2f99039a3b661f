/**
 * @file reconcile_diagnostics.hpp
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reqsync_enums.hpp"

namespace reqsync
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Data anomaly that was degraded locally; reconciliation continued.
    Error     ///< A module was skipped; no actions were produced for it.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    UnknownRequirementType,     ///< Item references a requirement type the snapshot does not declare.
    AttributesWithoutType,      ///< Item carries attributes but names no requirement type.
    AttributeKindChanged,       ///< Attribute definition changed its kind; it is recreated.
    MissingDataTypeDefinition,  ///< Enum attribute definition has no data-type definition.
    UnknownEnumLiteral,         ///< Enum value lists a literal its data type does not declare.
    ItemKindChanged,            ///< Snapshot folder matches a live requirement; its children are not reconciled.
    ModuleSkipped               ///< A module's reconciliation was aborted.
};

/**
 * @brief A single diagnostic item (error or warning).
 *
 * @details
 * `subject` names the snapshot entity the issue is about: a work item
 * identifier, a requirement type identifier, an attribute name, or a module
 * identifier for skipped modules.
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;
    std::string subject;
};

// ============================================================================
// ReconcileDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while calculating a change set.
 *
 * @details
 * `ReconcileDiagnostics` is the log of a reconciliation run. Per-node data
 * anomalies (unknown requirement types, attributes without a type) are
 * recorded as warnings; a module whose reconciliation was aborted by a
 * `ReqSyncError` is recorded as an error by `calculate_change_set()`.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe once the producing run has finished.
 */
class ReconcileDiagnostics
{
public:
    /**
     * @brief Check if any module was skipped.
     */
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    /**
     * @brief Check if any data anomaly was recorded.
     */
    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    /**
     * @brief Record a warning.
     */
    void warn(DiagnosticCategory category, std::string subject, std::string message)
    {
        m_warnings.push_back(DiagnosticItem{
            DiagnosticSeverity::Warning, category, std::move(message), std::move(subject)});
    }

    /**
     * @brief Record an error.
     */
    void error(DiagnosticCategory category, std::string subject, std::string message)
    {
        m_errors.push_back(DiagnosticItem{
            DiagnosticSeverity::Error, category, std::move(message), std::move(subject)});
    }

    /**
     * @brief Append all items of another diagnostics object.
     */
    void absorb(const ReconcileDiagnostics& other)
    {
        m_errors.insert(m_errors.end(), other.m_errors.begin(), other.m_errors.end());
        m_warnings.insert(m_warnings.end(), other.m_warnings.begin(), other.m_warnings.end());
    }

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace reqsync
