/**
 * @file process_runner.hpp
 * @brief Runs external commands for RestoreVault.
 *
 * Defines the narrow executor capability used by the destinations, and its POSIX
 * implementation based on posix_spawnp. Tests substitute their own executor to record
 * invocations instead of spawning processes.
 *
 * @note The POSIX executor discards the child's standard output and leaves standard error
 * attached to the caller's, so restore tool diagnostics stay visible.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include "command_spec.hpp"
#include "restore_error.hpp"

/**
 * @brief Interface for command execution strategies.
 */
class CommandExecutor {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~CommandExecutor() = default;

    /**
     * @brief Runs a command to completion.
     *
     * When input is present it is written in full to the command's standard input, which is
     * then closed. Blocks until the command exits.
     *
     * @param spec Command to run.
     * @param input Optional payload for the command's standard input.
     * @return std::expected<void, RestoreError> Success only if the command exited with status 0.
     */
    virtual std::expected<void, RestoreError> run(const CommandSpec& spec,
                                                  std::optional<std::span<const std::uint8_t>> input) = 0;
};

/**
 * @brief Executor that spawns local processes with posix_spawnp.
 *
 * Failure to spawn yields RestoreErrorKind::SpawnFailed, an abnormal exit yields
 * RestoreErrorKind::ProcessFailed. Errors while writing the payload are not fatal by
 * themselves: the exit status decides, and a failing exit reports how much of the payload
 * the command accepted.
 */
class PosixCommandExecutor : public CommandExecutor {
public:
    std::expected<void, RestoreError> run(const CommandSpec& spec,
                                          std::optional<std::span<const std::uint8_t>> input) override;
};

/**
 * @brief Describes a waitpid() status ("exit status 1", "terminated by signal 9 (Killed)").
 */
std::string describeWaitStatus(int status);

#endif // PROCESS_RUNNER_HPP
