/**
 * @file reqsync_exceptions.hpp
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reqsync_enums.hpp"

namespace reqsync
{

/**
 * @brief Error codes for change-set calculation.
 *
 * @details
 * All codes are fatal for the module being reconciled: no partial action list
 * is produced for that module. Per-node anomalies that do not abort the
 * module are reported through `ReconcileDiagnostics` instead.
 */
enum class ReqSyncErrorCode
{
    InvalidTrackerConfig,
    MissingTargetModule,
    MissingSnapshot,
    InvalidFieldValue,
    AmbiguousLabel  ///< Two snapshot entities derive the same promise label or definition identifier.
};

/**
 * @brief Exception class for change-set calculation errors.
 *
 * @details
 * `ReqSyncError` is thrown by `TrackerChange` and its collaborators when the
 * configuration is incomplete, the target module cannot be found, the
 * snapshot carries values that violate their declared attribute kind, or
 * snapshot names join into labels that cannot be told apart. Each
 * exception carries an error code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class ReqSyncError : public std::exception
{
public:
    /**
     * @brief Construct a ReqSyncError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    ReqSyncError(ReqSyncErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     * @return The error code for this exception.
     */
    ReqSyncErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ReqSyncErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Thrown when a snapshot attribute value fails validation.
 *
 * @details
 * Carries the attribute name and the offending value so that callers can
 * report the broken snapshot entry precisely.
 */
class InvalidFieldValueError : public ReqSyncError
{
public:
    InvalidFieldValueError(std::string attribute_name, Primitive value, std::string message)
        : ReqSyncError(ReqSyncErrorCode::InvalidFieldValue, std::move(message))
        , m_attribute_name(std::move(attribute_name))
        , m_value(std::move(value))
    {
    }

    /**
     * @brief Name of the attribute whose value was rejected.
     */
    const std::string& attribute_name() const noexcept
    {
        return m_attribute_name;
    }

    /**
     * @brief The rejected value.
     */
    const Primitive& value() const noexcept
    {
        return m_value;
    }

private:
    std::string m_attribute_name;
    Primitive m_value;
};

} // namespace reqsync
