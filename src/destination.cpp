#include "destination.hpp"
#include "reset_policy.hpp"
#include <format>
#include <print>
#include <stdexcept>
#include <utility>

namespace {

// ssh reports its own failures (unreachable host, rejected key) as 255; sshpass uses 5 for a
// rejected password and 6 for an unknown host key.
bool isTransportFailure(const TunnelConfig& tunnel, const RestoreError& error) {
    if (error.kind != RestoreErrorKind::ProcessFailed || !error.exitCode) {
        return false;
    }
    if (*error.exitCode == 255) {
        return true;
    }
    bool viaSshpass = tunnel.password && !tunnel.password->empty();
    return viaSshpass && (*error.exitCode == 5 || *error.exitCode == 6);
}

} // namespace

ToolDestination::ToolDestination(std::string tool,
                                 ConnectionTarget target,
                                 bool resetTarget,
                                 std::optional<TunnelConfig> tunnel,
                                 std::shared_ptr<CommandExecutor> executor,
                                 std::shared_ptr<ToolLocator> locator)
    : tool_(std::move(tool)),
      target_(std::move(target)),
      resetTarget_(resetTarget),
      tunnel_(std::move(tunnel)),
      executor_(std::move(executor)),
      locator_(std::move(locator)) {
    if (target_.host.empty() || target_.database.empty() || target_.username.empty()) {
        throw std::runtime_error("Invalid connection target: host, database, or username missing");
    }
    if (target_.port < 1 || target_.port > 65535) {
        throw std::runtime_error(std::format("Invalid connection target port: {}", target_.port));
    }
    if (tunnel_ && tunnel_->host.empty()) {
        throw std::runtime_error("Invalid tunnel: host missing");
    }
    if (tunnel_ && (tunnel_->port < 1 || tunnel_->port > 65535)) {
        throw std::runtime_error(std::format("Invalid tunnel port: {}", tunnel_->port));
    }
    if (!executor_ || !locator_) {
        throw std::runtime_error("Destination requires a command executor and a tool locator");
    }
}

std::expected<void, RestoreError> ToolDestination::initialize() {
    if (!locator_->exists(tool_)) {
        return std::unexpected(RestoreError{RestoreErrorKind::ToolNotFound,
            std::format("{} not found in PATH", tool_), std::nullopt});
    }
    if (tunnel_) {
        std::string transport = tunnel_->password && !tunnel_->password->empty() ? "sshpass" : "ssh";
        if (!locator_->exists(transport)) {
            return std::unexpected(RestoreError{RestoreErrorKind::ToolNotFound,
                std::format("{} not found in PATH, required to reach {}", transport, tunnel_->host), std::nullopt});
        }
    }

    if (resetTarget_) {
        std::println("Resetting {} on {}:{}...", target_.database, target_.host, target_.port);
        auto result = runTool(resetCommand(), std::nullopt);
        if (!result) {
            return std::unexpected(result.error());
        }
    }

    initialized_ = true;
    return {};
}

std::expected<void, RestoreError> ToolDestination::write(const Bytes& data) {
    std::println("Restoring {} bytes into {} on {}:{}...", data.size(), target_.database, target_.host, target_.port);
    return runTool(writeCommand(), std::span<const std::uint8_t>(data));
}

std::expected<void, RestoreError> ToolDestination::runTool(const CommandSpec& spec,
                                                           std::optional<std::span<const std::uint8_t>> input) {
    SecretEnvironment env = secrets();
    CommandSpec command = applyTunnel(spec, env, tunnel_);
    std::println("Executing {}", describeCommand(command, env));

    auto result = executor_->run(command, input);
    if (!result && tunnel_ && isTransportFailure(*tunnel_, result.error())) {
        return std::unexpected(RestoreError{RestoreErrorKind::SpawnFailed,
            std::format("Could not run {} on {}: {}", tool_, tunnel_->host, result.error().message),
            result.error().exitCode});
    }
    return result;
}

PostgreSQLDestination::PostgreSQLDestination(ConnectionTarget target,
                                             bool resetSchema,
                                             std::optional<TunnelConfig> tunnel,
                                             std::shared_ptr<CommandExecutor> executor,
                                             std::shared_ptr<ToolLocator> locator)
    : ToolDestination("psql", std::move(target), resetSchema, std::move(tunnel), std::move(executor), std::move(locator)) {}

CommandSpec PostgreSQLDestination::baseCommand() const {
    return CommandSpec{tool(),
                       {"-h", target().host,
                        "-p", std::to_string(target().port),
                        "-d", target().database,
                        "-U", target().username},
                       {}};
}

CommandSpec PostgreSQLDestination::resetCommand() const {
    CommandSpec spec = baseCommand();
    spec.args.insert(spec.args.end(), {"-c", resetStatement(target().username)});
    return spec;
}

CommandSpec PostgreSQLDestination::writeCommand() const {
    return baseCommand();
}

SecretEnvironment PostgreSQLDestination::secrets() const {
    SecretEnvironment env;
    if (!target().password.empty()) {
        env.set("PGPASSWORD", target().password);
    }
    return env;
}

MySQLDestination::MySQLDestination(ConnectionTarget target,
                                   bool resetDatabase,
                                   std::optional<TunnelConfig> tunnel,
                                   std::shared_ptr<CommandExecutor> executor,
                                   std::shared_ptr<ToolLocator> locator)
    : ToolDestination("mysql", std::move(target), resetDatabase, std::move(tunnel), std::move(executor), std::move(locator)) {}

CommandSpec MySQLDestination::baseCommand() const {
    return CommandSpec{tool(),
                       {"-h", target().host,
                        "-P", std::to_string(target().port),
                        "-u", target().username},
                       {}};
}

CommandSpec MySQLDestination::resetCommand() const {
    // The database may not exist yet, so no default database is selected.
    CommandSpec spec = baseCommand();
    spec.args.insert(spec.args.end(), {"-e", mysqlResetStatement(target().database)});
    return spec;
}

CommandSpec MySQLDestination::writeCommand() const {
    CommandSpec spec = baseCommand();
    spec.args.insert(spec.args.end(), {"-D", target().database});
    return spec;
}

SecretEnvironment MySQLDestination::secrets() const {
    SecretEnvironment env;
    if (!target().password.empty()) {
        env.set("MYSQL_PWD", target().password);
    }
    return env;
}
