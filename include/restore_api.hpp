/**
 * @file restore_api.hpp
 * @brief High-level API for interacting with the RestoreVault restore system.
 *
 * Provides a simplified entry point for running a restore from a configuration file,
 * converting configuration and setup exceptions into error results.
 */

#ifndef RESTORE_API_HPP
#define RESTORE_API_HPP

#include <expected>
#include <string>

/**
 * @brief API for running restores.
 */
class RestoreAPI {
public:
    /**
     * @brief Restores a dump into the configured destination.
     *
     * @param configFile Path to the JSON configuration file.
     * @param dumpPath Dump file, or "-" for standard input.
     * @return std::expected<void, std::string> Success or an error message; an unusable
     *         configuration is reported as InvalidConfiguration.
     */
    static std::expected<void, std::string> startRestore(const std::string& configFile, const std::string& dumpPath);
};

#endif // RESTORE_API_HPP
