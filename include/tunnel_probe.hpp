/**
 * @file tunnel_probe.hpp
 * @brief Pre-flight checks of the bastion host used for tunneled restores.
 *
 * Connects to the bastion with libssh before any restore command runs, so an unreachable host,
 * rejected credentials or a missing remote tool are reported up front instead of as an opaque
 * ssh exit status halfway through a restore.
 *
 * @note Requires libssh. Install via vcpkg on Windows, Homebrew on macOS, or apt on Linux.
 */

#ifndef TUNNEL_PROBE_HPP
#define TUNNEL_PROBE_HPP

#include <expected>
#include <string>
#include "remote_command.hpp"
#include "restore_error.hpp"

/**
 * @brief Outcome of looking the bastion's host key up in known_hosts.
 */
enum class HostKeyState {
    Known,      ///< Key matches a known_hosts entry.
    Changed,    ///< A different key of the same type is recorded.
    OtherType,  ///< Only keys of another type are recorded.
    Unknown,    ///< Host is not listed.
    NotFound,   ///< No known_hosts file exists.
    Error       ///< The lookup itself failed.
};

/**
 * @brief Accepts only a host key that matches known_hosts.
 *
 * Credentials are sent only after this check passes, the same policy ssh applies in batch
 * mode and sshpass applies to unknown hosts.
 *
 * @param tunnel Bastion settings, used for the diagnostic.
 * @param state Result of the known_hosts lookup.
 * @return std::expected<void, RestoreError> Success, or TunnelUnreachable for any other state.
 */
std::expected<void, RestoreError> checkHostKey(const TunnelConfig& tunnel, HostKeyState state);

/**
 * @brief libssh based bastion probe.
 */
class SSHTunnelProbe {
public:
    /**
     * @brief Constructs a probe.
     *
     * @param timeoutSeconds Connection timeout.
     */
    explicit SSHTunnelProbe(long timeoutSeconds = 10);

    /**
     * @brief Connects, authenticates and checks that a tool resolves on the bastion.
     *
     * Authenticates with the tunnel password when set, otherwise with the configured key or
     * the default keys and agent.
     *
     * @param tunnel Bastion settings.
     * @param tool Executable that must resolve on the bastion's PATH; empty skips the check.
     * @return std::expected<void, RestoreError> Success, TunnelUnreachable or ToolNotFound.
     */
    std::expected<void, RestoreError> probe(const TunnelConfig& tunnel, const std::string& tool) const;

private:
    long timeoutSeconds_; ///< Connection timeout in seconds.
};

#endif // TUNNEL_PROBE_HPP
