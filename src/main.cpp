#include "restore_api.hpp"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string configFile = "restore_config.json";
    std::string dumpPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (dumpPath.empty()) {
            dumpPath = arg;
        } else {
            dumpPath.clear();
            break;
        }
    }

    if (dumpPath.empty()) {
        std::cerr << "Usage: " << argv[0] << " [--config <path>] <dump-file|->" << std::endl;
        return 1;
    }

    auto result = RestoreAPI::startRestore(configFile, dumpPath);
    if (!result) {
        std::cerr << "Error: " << result.error() << std::endl;
        return 1;
    }

    std::cout << "Restore completed successfully." << std::endl;
    return 0;
}
