/**
 * @file restore_config.hpp
 * @brief Configuration management for the RestoreVault restore system.
 *
 * Defines the configuration structures and class for restore settings: the destination
 * database, the optional bastion tunnel, and where logs go.
 *
 * @note Configuration is loaded from a JSON file. Passwords may be given inline or through an
 * environment variable named by "password_env".
 */

#ifndef RESTORE_CONFIG_HPP
#define RESTORE_CONFIG_HPP

#include <optional>
#include <string>
#include <json/json.h>
#include "remote_command.hpp"

/**
 * @brief Structure for the destination database configuration.
 */
struct DestinationConfig {
    std::string type;        ///< Destination type ("postgresql", "mysql").
    std::string host;        ///< Database host (e.g., "localhost").
    int port;                ///< Database port (e.g., 5432 for PostgreSQL, 3306 for MySQL).
    std::string database;    ///< Database to restore into.
    std::string user;        ///< Database username.
    std::string password;    ///< Database password, possibly resolved from the environment.
    bool wipeDatabase;       ///< Reset the target before restoring.
};

/**
 * @brief Configuration class for the restore system.
 *
 * Loads and validates settings from a JSON configuration file, and provides logging.
 */
class RestoreConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is missing, unparsable or invalid.
     */
    explicit RestoreConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed JSON document.
     *
     * @param configJson Parsed configuration.
     * @throws std::runtime_error If the configuration is invalid.
     */
    static RestoreConfig fromJson(const Json::Value& configJson);

    /**
     * @brief Logs a message to stdout and the restore log file.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the error log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    std::string logDir;                     ///< Directory for log files.
    std::string logFile;                    ///< Path to the restore log file.
    std::string errorLogFile;               ///< Path to the error log file.
    DestinationConfig destination;          ///< Destination database.
    std::optional<TunnelConfig> tunnel;     ///< Bastion host, if restores go through one.

private:
    RestoreConfig() = default;

    void load(const Json::Value& configJson);
    void appendToLog(const std::string& path, const std::string& entry) const;
};

#endif // RESTORE_CONFIG_HPP
