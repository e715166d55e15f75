#include "tunnel_probe.hpp"
#include <libssh/libssh.h>
#include <format>
#include <print>

namespace {

RestoreError unreachable(const TunnelConfig& tunnel, const std::string& reason) {
    return RestoreError{RestoreErrorKind::TunnelUnreachable,
                        std::format("Tunnel {}:{}: {}", tunnel.host, tunnel.port, reason), std::nullopt};
}

HostKeyState toHostKeyState(ssh_known_hosts_e state) {
    switch (state) {
        case SSH_KNOWN_HOSTS_OK: return HostKeyState::Known;
        case SSH_KNOWN_HOSTS_CHANGED: return HostKeyState::Changed;
        case SSH_KNOWN_HOSTS_OTHER: return HostKeyState::OtherType;
        case SSH_KNOWN_HOSTS_UNKNOWN: return HostKeyState::Unknown;
        case SSH_KNOWN_HOSTS_NOT_FOUND: return HostKeyState::NotFound;
        default: return HostKeyState::Error;
    }
}

} // namespace

std::expected<void, RestoreError> checkHostKey(const TunnelConfig& tunnel, HostKeyState state) {
    switch (state) {
        case HostKeyState::Known:
            return {};
        case HostKeyState::Changed:
            return std::unexpected(unreachable(tunnel, "host key does not match known_hosts"));
        case HostKeyState::OtherType:
            return std::unexpected(unreachable(tunnel, "known_hosts lists a key of another type"));
        case HostKeyState::Unknown:
            return std::unexpected(unreachable(tunnel, "host is not in known_hosts"));
        case HostKeyState::NotFound:
            return std::unexpected(unreachable(tunnel, "no known_hosts file"));
        case HostKeyState::Error:
            break;
    }
    return std::unexpected(unreachable(tunnel, "host key check failed"));
}

SSHTunnelProbe::SSHTunnelProbe(long timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {}

std::expected<void, RestoreError> SSHTunnelProbe::probe(const TunnelConfig& tunnel, const std::string& tool) const {
    ssh_session ssh = ssh_new();
    if (!ssh) {
        return std::unexpected(unreachable(tunnel, "failed to create SSH session"));
    }
    int port = tunnel.port;
    long timeout = timeoutSeconds_;
    ssh_options_set(ssh, SSH_OPTIONS_HOST, tunnel.host.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout);
    if (!tunnel.user.empty()) {
        ssh_options_set(ssh, SSH_OPTIONS_USER, tunnel.user.c_str());
    }
    if (tunnel.privateKeyPath) {
        ssh_options_set(ssh, SSH_OPTIONS_ADD_IDENTITY, tunnel.privateKeyPath->c_str());
    }

    if (ssh_connect(ssh) != SSH_OK) {
        auto error = unreachable(tunnel, std::format("SSH connection failed: {}", ssh_get_error(ssh)));
        ssh_free(ssh);
        return std::unexpected(error);
    }

    auto hostKey = checkHostKey(tunnel, toHostKeyState(ssh_session_is_known_server(ssh)));
    if (!hostKey) {
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(hostKey.error());
    }

    int auth = tunnel.password && !tunnel.password->empty()
        ? ssh_userauth_password(ssh, nullptr, tunnel.password->c_str())
        : ssh_userauth_publickey_auto(ssh, nullptr, nullptr);
    if (auth != SSH_AUTH_SUCCESS) {
        auto error = unreachable(tunnel, std::format("SSH authentication failed: {}", ssh_get_error(ssh)));
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(error);
    }

    if (tool.empty()) {
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return {};
    }

    ssh_channel channel = ssh_channel_new(ssh);
    if (!channel || ssh_channel_open_session(channel) != SSH_OK) {
        if (channel) {
            ssh_channel_free(channel);
        }
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(unreachable(tunnel, "failed to open SSH channel"));
    }

    std::string check = std::format("command -v {}", shellQuote(tool));
    if (ssh_channel_request_exec(channel, check.c_str()) != SSH_OK) {
        ssh_channel_close(channel);
        ssh_channel_free(channel);
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(unreachable(tunnel, "failed to execute remote command"));
    }

    char buf[256];
    while (ssh_channel_read(channel, buf, sizeof(buf), 0) > 0) {
    }
    ssh_channel_send_eof(channel);
    ssh_channel_close(channel);
    int status = ssh_channel_get_exit_status(channel);
    ssh_channel_free(channel);
    ssh_disconnect(ssh);
    ssh_free(ssh);

    if (status != 0) {
        return std::unexpected(RestoreError{RestoreErrorKind::ToolNotFound,
            std::format("{} not found in PATH on {}", tool, tunnel.host), std::nullopt});
    }
    std::println("Tunnel {}:{} verified, {} available", tunnel.host, tunnel.port, tool);
    return {};
}
