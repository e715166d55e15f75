/**
 * @file restore.hpp
 * @brief Restore orchestration for RestoreVault.
 *
 * Ties the configuration, the optional bastion probe and a destination together: reads one
 * dump, prepares the destination and streams the dump into it, logging every step.
 *
 * @note The destination's database client must be on the PATH; see destination.hpp.
 */

#ifndef RESTORE_HPP
#define RESTORE_HPP

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include "command_spec.hpp"
#include "destination.hpp"
#include "restore_config.hpp"
#include "tunnel_probe.hpp"

/**
 * @brief Reads a complete dump into memory.
 *
 * @param path Dump file, or "-" for standard input.
 * @return std::expected<Bytes, RestoreError> Dump contents or InputUnavailable.
 */
std::expected<Bytes, RestoreError> readDump(const std::string& path);

/**
 * @brief Creates the destination matching a configuration.
 *
 * @param config Destination settings; type is "postgresql" (or "postgres") or "mysql".
 * @param tunnel Optional bastion host.
 * @param executor Command executor handed to the destination.
 * @param locator Tool locator handed to the destination.
 * @return std::unique_ptr<ToolDestination> The destination.
 * @throws std::runtime_error If the type is unsupported or the settings are invalid.
 */
std::unique_ptr<ToolDestination> makeDestination(const DestinationConfig& config,
                                                 const std::optional<TunnelConfig>& tunnel,
                                                 std::shared_ptr<CommandExecutor> executor,
                                                 std::shared_ptr<ToolLocator> locator);

/**
 * @brief Main restore class orchestrating one restore run.
 */
class Restore {
public:
    /**
     * @brief Constructs a restore from a configuration file, using real processes.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the configuration is invalid.
     */
    explicit Restore(const std::string& configFile);

    /**
     * @brief Constructs a restore with explicit collaborators.
     *
     * @param config Loaded configuration.
     * @param executor Command executor for the destination.
     * @param locator Tool locator for the destination.
     * @throws std::runtime_error If the configuration is invalid.
     */
    Restore(RestoreConfig config, std::shared_ptr<CommandExecutor> executor, std::shared_ptr<ToolLocator> locator);

    /**
     * @brief Restores one dump.
     *
     * Probes the tunnel when verification is enabled, reads the dump, initializes the
     * destination (resetting it if configured) and writes the dump.
     *
     * @param dumpPath Dump file, or "-" for standard input.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> execute(const std::string& dumpPath);

    const RestoreConfig& configuration() const { return config; }

private:
    std::expected<void, std::string> fail(const std::string& stage, const RestoreError& error);

    RestoreConfig config;                        ///< Restore configuration.
    std::unique_ptr<ToolDestination> destination; ///< Destination database.
    std::optional<SSHTunnelProbe> tunnelProbe;    ///< Bastion probe, when verification is enabled.
};

#endif // RESTORE_HPP
