#include "remote_command.hpp"
#include <format>
#include <stdexcept>
#include <string_view>

namespace {

bool isShellSafe(char c) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return std::string_view("_@%+=:,./-").find(c) != std::string_view::npos;
}

std::vector<std::string> sshArguments(const TunnelConfig& tunnel, bool usePassword, const std::string& remoteCommand) {
    std::vector<std::string> args{"-p", std::to_string(tunnel.port)};
    if (tunnel.privateKeyPath && !tunnel.privateKeyPath->empty()) {
        args.insert(args.end(), {"-i", *tunnel.privateKeyPath});
    }
    if (!usePassword) {
        // Never fall back to an interactive password prompt.
        args.insert(args.end(), {"-o", "BatchMode=yes"});
    }
    if (tunnel.forward) {
        const auto& fwd = *tunnel.forward;
        args.insert(args.end(), {"-L", std::format("{}:{}:{}", fwd.localPort, fwd.remoteHost, fwd.remotePort)});
    }
    if (!tunnel.user.empty()) {
        args.insert(args.end(), {"-l", tunnel.user});
    }
    // "--" keeps a host starting with '-' from being parsed as an option.
    args.insert(args.end(), {"--", tunnel.host, remoteCommand});
    return args;
}

} // namespace

std::string shellQuote(const std::string& word) {
    if (word.empty()) {
        return "''";
    }
    bool safe = true;
    for (char c : word) {
        if (!isShellSafe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return word;
    }

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string renderCommandLine(const CommandSpec& spec) {
    std::string line = shellQuote(spec.program);
    for (const auto& arg : spec.args) {
        line += ' ';
        line += shellQuote(arg);
    }
    return line;
}

CommandSpec wrapRemoteCommand(const CommandSpec& spec, const SecretEnvironment& secrets, const TunnelConfig& tunnel) {
    if (tunnel.host.empty()) {
        throw std::invalid_argument("Tunnel host is required");
    }
    if (tunnel.port < 1 || tunnel.port > 65535) {
        throw std::invalid_argument(std::format("Invalid tunnel port: {}", tunnel.port));
    }

    std::string remoteCommand;
    for (const auto& [name, value] : spec.env) {
        if (!secrets.entries().contains(name)) {
            remoteCommand += std::format("export {}={}; ", name, shellQuote(value));
        }
    }
    for (const auto& [name, value] : secrets.entries()) {
        remoteCommand += std::format("export {}={}; ", name, shellQuote(value));
    }
    remoteCommand += renderCommandLine(spec);

    bool usePassword = tunnel.password && !tunnel.password->empty();
    CommandSpec wrapped;
    if (usePassword) {
        wrapped.program = "sshpass";
        wrapped.args = {"-e", "ssh"};
        auto args = sshArguments(tunnel, usePassword, remoteCommand);
        wrapped.args.insert(wrapped.args.end(), args.begin(), args.end());
        wrapped.env["SSHPASS"] = *tunnel.password;
    } else {
        wrapped.program = "ssh";
        wrapped.args = sshArguments(tunnel, usePassword, remoteCommand);
    }
    return wrapped;
}

CommandSpec applyTunnel(const CommandSpec& spec, const SecretEnvironment& secrets,
                        const std::optional<TunnelConfig>& tunnel) {
    if (tunnel) {
        return wrapRemoteCommand(spec, secrets, *tunnel);
    }
    CommandSpec local = spec;
    for (const auto& [name, value] : secrets.entries()) {
        local.env[name] = value;
    }
    return local;
}

std::string describeCommand(const CommandSpec& spec, const SecretEnvironment& secrets) {
    CommandSpec shown{spec.program, {}, {}};
    for (const auto& arg : spec.args) {
        // Secrets embedded in a remote command appear as shell-quoted export assignments.
        shown.args.push_back(secrets.redact(secrets.redact(arg, shellQuote)));
    }

    std::string line;
    if (!spec.env.empty()) {
        line = "env";
        for (const auto& [name, value] : spec.env) {
            line += std::format(" {}=***", name);
        }
        line += ' ';
    }
    return line + renderCommandLine(shown);
}
