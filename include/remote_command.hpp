/**
 * @file remote_command.hpp
 * @brief Executes restore commands on a trusted bastion host over SSH.
 *
 * Wrapping is a pure CommandSpec -> CommandSpec transformation: the original command is
 * turned into a single remote shell command line handed to the ssh client. ssh does not
 * forward the local environment to non-interactive remote commands, so secrets are
 * re-materialized as export assignments in front of the remote command.
 *
 * @note Requires the OpenSSH client on the local host, and sshpass when the bastion is
 * reached with a password instead of a key.
 */

#ifndef REMOTE_COMMAND_HPP
#define REMOTE_COMMAND_HPP

#include <optional>
#include <string>
#include "command_spec.hpp"

/**
 * @brief Local port forward opened alongside the remote command (ssh -L).
 */
struct PortForward {
    int localPort;          ///< Port bound on the local host.
    std::string remoteHost; ///< Host as seen from the bastion.
    int remotePort;         ///< Port on remoteHost.
};

/**
 * @brief Bastion host through which restore commands are executed.
 */
struct TunnelConfig {
    std::string host;                          ///< Bastion address.
    int port = 22;                             ///< SSH port.
    std::string user;                          ///< SSH user; empty uses the ssh client default.
    std::optional<std::string> password;       ///< Password authentication (via sshpass).
    std::optional<std::string> privateKeyPath; ///< Identity file for key authentication.
    std::optional<PortForward> forward;        ///< Optional -L forward.
    bool verify = false;                       ///< Probe the bastion before restoring.
};

/**
 * @brief Quotes a single word for a POSIX shell.
 *
 * Words made only of [A-Za-z0-9_@%+=:,./-] are returned unchanged; anything else is wrapped
 * in single quotes with embedded quotes written as '\''.
 */
std::string shellQuote(const std::string& word);

/**
 * @brief Renders program and arguments as one shell-safe command line.
 */
std::string renderCommandLine(const CommandSpec& spec);

/**
 * @brief Wraps a command so it runs on the bastion host.
 *
 * The resulting command runs the ssh client (or sshpass -e ssh when the tunnel carries a
 * password, with the password in SSHPASS) against tunnel.host, with one remote command of
 * the form "export NAME=value; program args...".
 *
 * @param spec Command to run remotely.
 * @param secrets Variables to export in the remote shell before running spec.
 * @param tunnel Bastion settings.
 * @return CommandSpec Command to run locally.
 * @throws std::invalid_argument If the tunnel host is empty or the port is out of range.
 */
CommandSpec wrapRemoteCommand(const CommandSpec& spec, const SecretEnvironment& secrets, const TunnelConfig& tunnel);

/**
 * @brief Routes secrets to a command, through the bastion when one is configured.
 *
 * Without a tunnel, secrets are merged into the local environment overrides of spec.
 */
CommandSpec applyTunnel(const CommandSpec& spec, const SecretEnvironment& secrets,
                        const std::optional<TunnelConfig>& tunnel);

/**
 * @brief Renders a command line for logs, with all secret values replaced by "***".
 *
 * Environment overrides are listed by name only.
 */
std::string describeCommand(const CommandSpec& spec, const SecretEnvironment& secrets);

#endif // REMOTE_COMMAND_HPP
