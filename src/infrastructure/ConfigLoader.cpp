/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace logicchat::infrastructure {

AppConfig ConfigLoader::Load(const std::string& configPath) {
    AppConfig config;

    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json j;
            f >> j;
            config = FromJson(j);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                      << ". Using defaults." << std::endl;
            config = AppConfig{};
        }
    }

    ApplyEnvironment(config);
    return config;
}

AppConfig ConfigLoader::FromJson(const nlohmann::json& j, AppConfig base) {
    if (!j.is_object()) {
        throw std::invalid_argument("ConfigLoader: settings must be a JSON object.");
    }

    AppConfig config = std::move(base);
    if (j.contains("host")) config.host = j["host"].get<std::string>();
    if (j.contains("port")) config.port = j["port"].get<int>();
    if (j.contains("data_dir")) config.dataDir = j["data_dir"].get<std::string>();
    if (j.contains("log_file")) config.logFile = j["log_file"].get<std::string>();
    if (j.contains("static_dir")) config.staticDir = j["static_dir"].get<std::string>();
    if (j.contains("history_limit")) config.historyLimit = j["history_limit"].get<int>();
    if (j.contains("max_expression_length")) config.maxExpressionLength = j["max_expression_length"].get<std::size_t>();
    if (j.contains("max_nesting_depth")) config.maxNestingDepth = j["max_nesting_depth"].get<int>();
    if (j.contains("recall_window")) config.recallWindow = j["recall_window"].get<std::size_t>();

    config.validate();
    return config;
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    const char* port = std::getenv("PORT");
    if (port == nullptr || *port == '\0') return;

    char* end = nullptr;
    long value = std::strtol(port, &end, 10);
    if (*end != '\0' || value < 1 || value > 65535) {
        std::cerr << "[ConfigLoader] Ignoring invalid PORT value: " << port << std::endl;
        return;
    }
    config.port = static_cast<int>(value);
}

} // namespace logicchat::infrastructure
