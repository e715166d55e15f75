/**
 * @file restore_error.hpp
 * @brief Error taxonomy for RestoreVault.
 *
 * Every fallible restore operation returns std::expected<..., RestoreError> so callers can
 * branch on the failure kind instead of parsing message text.
 */

#ifndef RESTORE_ERROR_HPP
#define RESTORE_ERROR_HPP

#include <optional>
#include <string>

/**
 * @brief Failure categories reported by the restore subsystem.
 */
enum class RestoreErrorKind {
    ToolNotFound,          ///< Restore tool binary could not be resolved.
    SpawnFailed,           ///< The OS or the transport refused to start the command.
    ProcessFailed,         ///< The command ran but exited abnormally.
    StreamWriteFailed,     ///< Writing the payload to the command's stdin failed.
    InvalidConfiguration,  ///< Connection or tunnel settings are unusable.
    InputUnavailable,      ///< The dump could not be read.
    TunnelUnreachable      ///< The bastion host refused the connection or the credentials.
};

/**
 * @brief Returns a stable name for an error kind ("ToolNotFound", ...).
 */
const char* toString(RestoreErrorKind kind);

/**
 * @brief Structured error carried by std::expected results.
 */
struct RestoreError {
    RestoreErrorKind kind;          ///< Failure category.
    std::string message;            ///< Human-readable diagnostic.
    std::optional<int> exitCode;    ///< Raw exit code when the process exited normally.

    /**
     * @brief Formats the error as "<Kind>: <message>".
     */
    std::string describe() const;
};

#endif // RESTORE_ERROR_HPP
