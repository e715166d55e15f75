#include "restore_config.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

int readPort(const Json::Value& section, const char* key, int defaultPort, const char* what) {
    int port = section.get(key, defaultPort).asInt();
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::format("Invalid {} port: {}", what, port));
    }
    return port;
}

std::string resolvePassword(const Json::Value& section) {
    std::string password = section.get("password", "").asString();
    if (password.empty() && section.isMember("password_env")) {
        std::string variable = section["password_env"].asString();
        if (const char* value = std::getenv(variable.c_str())) {
            password = value;
        }
    }
    return password;
}

} // namespace

RestoreConfig::RestoreConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}: {}", configFile,
                                             reader.getFormattedErrorMessages()));
    }
    load(configJson);
}

RestoreConfig RestoreConfig::fromJson(const Json::Value& configJson) {
    RestoreConfig config;
    config.load(configJson);
    return config;
}

void RestoreConfig::load(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    logDir = configJson.get("log_dir", "./logs/").asString();
    logFile = (fs::path(logDir) / "restore.log").string();
    errorLogFile = (fs::path(logDir) / "errors.log").string();

    if (!configJson.isMember("destination") || !configJson["destination"].isObject()) {
        throw std::runtime_error("Missing destination section in configuration");
    }
    const Json::Value& db = configJson["destination"];
    destination.type = db.get("type", "postgresql").asString();
    bool isMySQL = destination.type == "mysql";
    destination.host = db.get("host", "localhost").asString();
    destination.port = readPort(db, "port", isMySQL ? 3306 : 5432, "destination");
    destination.database = db.get("database", "").asString();
    destination.user = db.get("user", isMySQL ? "root" : "postgres").asString();
    destination.password = resolvePassword(db);
    destination.wipeDatabase = db.get("wipe_database", false).asBool();
    if (destination.database.empty()) {
        throw std::runtime_error("Missing destination database name");
    }

    // Parse tunnel section
    if (configJson.isMember("tunnel") && !configJson["tunnel"].isNull()) {
        const Json::Value& t = configJson["tunnel"];
        TunnelConfig tunnelConfig;
        tunnelConfig.host = t.get("host", "").asString();
        if (tunnelConfig.host.empty()) {
            throw std::runtime_error("Missing tunnel host");
        }
        tunnelConfig.port = readPort(t, "port", 22, "tunnel");
        tunnelConfig.user = t.get("user", "").asString();
        std::string tunnelPassword = resolvePassword(t);
        if (!tunnelPassword.empty()) {
            tunnelConfig.password = tunnelPassword;
        }
        std::string key = t.get("private_key", "").asString();
        if (!key.empty()) {
            tunnelConfig.privateKeyPath = key;
        }
        if (t.isMember("forward")) {
            const Json::Value& fwd = t["forward"];
            tunnelConfig.forward = PortForward{
                readPort(fwd, "local_port", destination.port, "forward local"),
                fwd.get("remote_host", destination.host).asString(),
                readPort(fwd, "remote_port", destination.port, "forward remote")};
        }
        tunnelConfig.verify = t.get("verify", false).asBool();
        tunnel = tunnelConfig;
    }
}

void RestoreConfig::appendToLog(const std::string& path, const std::string& entry) const {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", path);
    }
}

void RestoreConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", timestamp(), message);
    std::println("{}", logEntry);
    appendToLog(logFile, logEntry);
}

void RestoreConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", timestamp(), message);
    std::println(stderr, "{}", logEntry);
    appendToLog(errorLogFile, logEntry);
}
