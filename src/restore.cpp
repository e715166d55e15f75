#include "restore.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <ios>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

std::expected<Bytes, RestoreError> readDump(const std::string& path) {
    if (path == "-") {
        Bytes data((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        if (std::cin.bad()) {
            return std::unexpected(RestoreError{RestoreErrorKind::InputUnavailable,
                "Failed to read dump from standard input", std::nullopt});
        }
        return data;
    }

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return std::unexpected(RestoreError{RestoreErrorKind::InputUnavailable,
            std::format("Dump path is a directory: {}", path), std::nullopt});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(RestoreError{RestoreErrorKind::InputUnavailable,
            std::format("Failed to open dump file: {}", path), std::nullopt});
    }
    try {
        Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            return std::unexpected(RestoreError{RestoreErrorKind::InputUnavailable,
                std::format("Failed to read dump file: {}", path), std::nullopt});
        }
        return data;
    } catch (const std::ios_base::failure& e) {
        // libstdc++ reports read errors from filebuf::underflow by throwing.
        return std::unexpected(RestoreError{RestoreErrorKind::InputUnavailable,
            std::format("Failed to read dump file {}: {}", path, e.what()), std::nullopt});
    }
}

std::unique_ptr<ToolDestination> makeDestination(const DestinationConfig& config,
                                                 const std::optional<TunnelConfig>& tunnel,
                                                 std::shared_ptr<CommandExecutor> executor,
                                                 std::shared_ptr<ToolLocator> locator) {
    ConnectionTarget target{config.host, config.port, config.database, config.user, config.password};
    if (config.type == "postgresql" || config.type == "postgres") {
        return std::make_unique<PostgreSQLDestination>(target, config.wipeDatabase, tunnel,
                                                       std::move(executor), std::move(locator));
    }
    if (config.type == "mysql") {
        return std::make_unique<MySQLDestination>(target, config.wipeDatabase, tunnel,
                                                  std::move(executor), std::move(locator));
    }
    throw std::runtime_error(std::format("Unsupported destination type: {}", config.type));
}

Restore::Restore(const std::string& configFile)
    : Restore(RestoreConfig(configFile), std::make_shared<PosixCommandExecutor>(), std::make_shared<PathToolLocator>()) {}

Restore::Restore(RestoreConfig config, std::shared_ptr<CommandExecutor> executor, std::shared_ptr<ToolLocator> locator)
    : config(std::move(config)) {
    destination = makeDestination(this->config.destination, this->config.tunnel, std::move(executor), std::move(locator));
    if (this->config.tunnel && this->config.tunnel->verify) {
        tunnelProbe.emplace();
    }
}

std::expected<void, std::string> Restore::fail(const std::string& stage, const RestoreError& error) {
    auto errorMsg = std::format("{} failed: {}", stage, error.describe());
    config.logError(errorMsg);
    return std::unexpected(errorMsg);
}

std::expected<void, std::string> Restore::execute(const std::string& dumpPath) {
    const auto& db = config.destination;

    if (tunnelProbe) {
        auto probeResult = tunnelProbe->probe(*config.tunnel, destination->tool());
        if (!probeResult) {
            return fail("Tunnel verification", probeResult.error());
        }
        config.logMessage(std::format("Tunnel {} verified", config.tunnel->host));
    }

    auto dump = readDump(dumpPath);
    if (!dump) {
        return fail("Reading dump", dump.error());
    }

    auto initResult = destination->initialize();
    if (!initResult) {
        return fail("Destination initialization", initResult.error());
    }
    if (db.wipeDatabase) {
        config.logMessage(std::format("Reset {} on {}:{}", db.database, db.host, db.port));
    }

    auto writeResult = destination->write(*dump);
    if (!writeResult) {
        return fail("Restore", writeResult.error());
    }

    config.logMessage(std::format("Restore completed: {} bytes from {} into {} on {}:{}{}",
                                  dump->size(), dumpPath, db.database, db.host, db.port,
                                  config.tunnel ? std::format(" via {}", config.tunnel->host) : ""));
    return {};
}
