/**
 * @file destination.hpp
 * @brief Restore destinations for RestoreVault.
 *
 * A destination delivers complete restore units into a live database by streaming them into
 * the database's command-line client, either locally or on a bastion host. Destinations are
 * synchronous: initialize() and write() each block for the lifetime of one client process.
 *
 * @note Requires the database client (psql or mysql) on the PATH, and the OpenSSH client when
 * a tunnel is configured.
 */

#ifndef DESTINATION_HPP
#define DESTINATION_HPP

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include "command_spec.hpp"
#include "process_runner.hpp"
#include "remote_command.hpp"
#include "restore_error.hpp"
#include "tool_locator.hpp"

/**
 * @brief Database endpoint a destination restores into.
 */
struct ConnectionTarget {
    std::string host;     ///< Database host.
    int port;             ///< Database port (1-65535).
    std::string database; ///< Database name.
    std::string username; ///< Role used for the restore.
    std::string password; ///< Password; only ever passed through the environment.
};

/**
 * @brief Interface for restore destinations.
 *
 * Contract: initialize() once, then write() any number of times. Each write is an
 * independent pass/fail unit; a failed write may leave a prefix of its statements applied.
 */
class Destination {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~Destination() = default;

    /**
     * @brief Prepares the destination.
     *
     * Verifies the restore tool is available and, if requested, resets the target.
     *
     * @return std::expected<void, RestoreError> Success or the first failure.
     */
    virtual std::expected<void, RestoreError> initialize() = 0;

    /**
     * @brief Restores one complete unit of statements.
     *
     * @param data Statements to feed to the restore tool, delivered verbatim.
     * @return std::expected<void, RestoreError> Success only if the restore tool succeeded.
     */
    virtual std::expected<void, RestoreError> write(const Bytes& data) = 0;
};

/**
 * @brief Base for destinations driven by a database command-line client.
 *
 * Owns the connection target, the optional tunnel and the reset flag, all fixed at
 * construction. Subclasses only describe the client invocations.
 */
class ToolDestination : public Destination {
public:
    std::expected<void, RestoreError> initialize() override;
    std::expected<void, RestoreError> write(const Bytes& data) override;

    bool initialized() const { return initialized_; }
    const ConnectionTarget& target() const { return target_; }
    const std::string& tool() const { return tool_; }

protected:
    /**
     * @brief Constructs a tool-driven destination.
     *
     * @throws std::runtime_error If the target or tunnel settings are invalid, or executor or
     * locator is null.
     */
    ToolDestination(std::string tool,
                    ConnectionTarget target,
                    bool resetTarget,
                    std::optional<TunnelConfig> tunnel,
                    std::shared_ptr<CommandExecutor> executor,
                    std::shared_ptr<ToolLocator> locator);

    virtual CommandSpec resetCommand() const = 0;
    virtual CommandSpec writeCommand() const = 0;
    virtual SecretEnvironment secrets() const = 0;

private:
    std::expected<void, RestoreError> runTool(const CommandSpec& spec, std::optional<std::span<const std::uint8_t>> input);

    std::string tool_;
    ConnectionTarget target_;
    bool resetTarget_;
    std::optional<TunnelConfig> tunnel_;
    std::shared_ptr<CommandExecutor> executor_;
    std::shared_ptr<ToolLocator> locator_;
    bool initialized_ = false;
};

/**
 * @brief PostgreSQL destination using psql.
 *
 * Reset drops and recreates the public schema. The password travels in PGPASSWORD.
 */
class PostgreSQLDestination : public ToolDestination {
public:
    /**
     * @brief Constructs a PostgreSQL destination.
     *
     * @param target Connection target.
     * @param resetSchema Reset the public schema during initialize().
     * @param tunnel Bastion to run psql on, or std::nullopt to run it locally.
     * @param executor Command executor; defaults to PosixCommandExecutor.
     * @param locator Tool locator; defaults to PathToolLocator.
     * @throws std::runtime_error If the configuration is invalid.
     */
    PostgreSQLDestination(ConnectionTarget target,
                          bool resetSchema,
                          std::optional<TunnelConfig> tunnel = std::nullopt,
                          std::shared_ptr<CommandExecutor> executor = std::make_shared<PosixCommandExecutor>(),
                          std::shared_ptr<ToolLocator> locator = std::make_shared<PathToolLocator>());

protected:
    CommandSpec resetCommand() const override;
    CommandSpec writeCommand() const override;
    SecretEnvironment secrets() const override;

private:
    CommandSpec baseCommand() const;
};

/**
 * @brief MySQL destination using the mysql client.
 *
 * Reset drops and recreates the whole database. The password travels in MYSQL_PWD.
 */
class MySQLDestination : public ToolDestination {
public:
    MySQLDestination(ConnectionTarget target,
                     bool resetDatabase,
                     std::optional<TunnelConfig> tunnel = std::nullopt,
                     std::shared_ptr<CommandExecutor> executor = std::make_shared<PosixCommandExecutor>(),
                     std::shared_ptr<ToolLocator> locator = std::make_shared<PathToolLocator>());

protected:
    CommandSpec resetCommand() const override;
    CommandSpec writeCommand() const override;
    SecretEnvironment secrets() const override;

private:
    CommandSpec baseCommand() const;
};

#endif // DESTINATION_HPP
