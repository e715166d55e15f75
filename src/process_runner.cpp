/**
 * @file process_runner.cpp
 * @brief posix_spawnp based command executor.
 */

#include "process_runner.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <format>
#include <print>
#include <string_view>
#include <vector>
#include <fcntl.h>
#include <pthread.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

struct InputDelivery {
    size_t written = 0;
    int error = 0;
};

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> result;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view assignment(*entry);
        std::string name(assignment.substr(0, assignment.find('=')));
        if (!overrides.contains(name)) {
            result.emplace_back(assignment);
        }
    }
    for (const auto& [name, value] : overrides) {
        result.push_back(std::format("{}={}", name, value));
    }
    return result;
}

std::vector<char*> toPointerArray(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

/**
 * @brief Writes the whole payload to fd with SIGPIPE blocked for the calling thread.
 *
 * A child that exits before draining its stdin turns the write into EPIPE instead of
 * killing the caller. A SIGPIPE raised meanwhile is consumed before the mask is restored.
 */
InputDelivery writePayload(int fd, std::span<const std::uint8_t> data) {
    sigset_t pipeSet;
    sigset_t oldSet;
    sigemptyset(&pipeSet);
    sigaddset(&pipeSet, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipeSet, &oldSet);

    InputDelivery delivery;
    while (delivery.written < data.size()) {
        ssize_t n = ::write(fd, data.data() + delivery.written, data.size() - delivery.written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            delivery.error = errno;
            break;
        }
        delivery.written += static_cast<size_t>(n);
    }

    if (delivery.error == EPIPE && !sigismember(&oldSet, SIGPIPE)) {
        struct timespec noWait{};
        while (sigtimedwait(&pipeSet, nullptr, &noWait) < 0 && errno == EINTR) {
        }
    }
    pthread_sigmask(SIG_SETMASK, &oldSet, nullptr);
    return delivery;
}

} // namespace

std::string describeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return std::format("exit status {}", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        return std::format("terminated by signal {} ({})", sig, strsignal(sig));
    }
    return std::format("unexpected wait status {}", status);
}

std::expected<void, RestoreError> PosixCommandExecutor::run(const CommandSpec& spec,
                                                            std::optional<std::span<const std::uint8_t>> input) {
    std::vector<std::string> argvStrings;
    argvStrings.push_back(spec.program);
    argvStrings.insert(argvStrings.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv = toPointerArray(argvStrings);

    std::vector<std::string> envStrings = buildEnvironment(spec.env);
    std::vector<char*> envp = toPointerArray(envStrings);

    int stdinPipe[2] = {-1, -1};
    if (input && pipe2(stdinPipe, O_CLOEXEC) != 0) {
        return std::unexpected(RestoreError{RestoreErrorKind::SpawnFailed,
            std::format("Failed to create stdin pipe for {}: {}", spec.program, std::strerror(errno)), std::nullopt});
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    if (input) {
        posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    } else {
        // Without a payload the child must not read the caller's stdin (ssh would forward it).
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    }
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = -1;
    int spawnError = posix_spawnp(&pid, spec.program.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    if (input) {
        close(stdinPipe[0]);
    }
    if (spawnError != 0) {
        if (input) {
            close(stdinPipe[1]);
        }
        return std::unexpected(RestoreError{RestoreErrorKind::SpawnFailed,
            std::format("Failed to start {}: {}", spec.program, std::strerror(spawnError)), std::nullopt});
    }

    InputDelivery delivery;
    if (input) {
        delivery = writePayload(stdinPipe[1], *input);
        close(stdinPipe[1]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(RestoreError{RestoreErrorKind::ProcessFailed,
                std::format("Failed to wait for {}: {}", spec.program, std::strerror(errno)), std::nullopt});
        }
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        if (delivery.error != 0) {
            std::println(stderr, "Warning: {} exited successfully after accepting {} of {} input bytes ({})",
                         spec.program, delivery.written, input->size(), std::strerror(delivery.error));
        }
        return {};
    }

    std::string message = std::format("{} failed with {}", spec.program, describeWaitStatus(status));
    if (delivery.error != 0) {
        message += std::format("; input stream closed after {} of {} bytes ({})",
                               delivery.written, input->size(), std::strerror(delivery.error));
    }
    std::optional<int> exitCode;
    if (WIFEXITED(status)) {
        exitCode = WEXITSTATUS(status);
    }
    return std::unexpected(RestoreError{RestoreErrorKind::ProcessFailed, message, exitCode});
}
