#include "restore_api.hpp"
#include "restore.hpp"
#include <format>
#include <memory>

std::expected<void, std::string> RestoreAPI::startRestore(const std::string& configFile, const std::string& dumpPath) {
    std::unique_ptr<Restore> restore;
    try {
        restore = std::make_unique<Restore>(configFile);
    } catch (const std::exception& e) {
        RestoreError error{RestoreErrorKind::InvalidConfiguration, e.what(), std::nullopt};
        return std::unexpected(std::format("Failed to start restore: {}", error.describe()));
    }

    try {
        return restore->execute(dumpPath);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Restore aborted: {}", e.what()));
    }
}
