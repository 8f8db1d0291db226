#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

using logicchat::infrastructure::AppConfig;
using logicchat::infrastructure::ConfigLoader;
namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

void TestDefaults() {
    AppConfig config;
    config.validate();
    assert(config.port == 5000);
    assert(config.historyLimit == 10);
    assert(config.maxExpressionLength == 512);
    assert(config.maxNestingDepth == 64);
    assert(config.recallWindow == 256);
    assert(config.logPath() == fs::path("data") / "conversation.ndjson");

    config.logFile = "/var/tmp/log.ndjson";
    assert(config.logPath() == fs::path("/var/tmp/log.ndjson"));
    std::cout << "[PASS] Defaults." << std::endl;
}

void TestFromJson() {
    auto config = ConfigLoader::FromJson(nlohmann::json{
        {"port", 8081},
        {"data_dir", "/srv/chat"},
        {"history_limit", 3},
        {"recall_window", 32},
        {"unknown_key", true}
    });
    assert(config.port == 8081);
    assert(config.dataDir == "/srv/chat");
    assert(config.historyLimit == 3);
    assert(config.recallWindow == 32);
    assert(config.host == "0.0.0.0");
    assert(config.logPath() == fs::path("/srv/chat") / "conversation.ndjson");

    bool threw = false;
    try {
        ConfigLoader::FromJson(nlohmann::json{{"port", 70000}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ConfigLoader::FromJson(nlohmann::json{{"history_limit", "ten"}});
    } catch (const nlohmann::json::exception&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] JSON keys applied and validated." << std::endl;
}

void TestLoad(const fs::path& root) {
    unsetenv("PORT");

    auto missing = ConfigLoader::Load((root / "absent.json").string());
    assert(missing.port == 5000);

    WriteFile(root / "good.json", R"({"host": "127.0.0.1", "port": 9000, "max_nesting_depth": 16})");
    auto good = ConfigLoader::Load((root / "good.json").string());
    assert(good.host == "127.0.0.1");
    assert(good.port == 9000);
    assert(good.maxNestingDepth == 16);

    WriteFile(root / "broken.json", "{ \"port\": ");
    auto broken = ConfigLoader::Load((root / "broken.json").string());
    assert(broken.port == 5000);

    WriteFile(root / "invalid.json", R"({"port": 0})");
    auto invalid = ConfigLoader::Load((root / "invalid.json").string());
    assert(invalid.port == 5000);
    std::cout << "[PASS] Settings file loading." << std::endl;
}

void TestEnvironment(const fs::path& root) {
    setenv("PORT", "8080", 1);
    auto config = ConfigLoader::Load((root / "good.json").string());
    assert(config.port == 8080);

    setenv("PORT", "not-a-port", 1);
    AppConfig untouched;
    ConfigLoader::ApplyEnvironment(untouched);
    assert(untouched.port == 5000);

    unsetenv("PORT");
    std::cout << "[PASS] PORT environment override." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    fs::path testRoot = "test_config_root";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    TestDefaults();
    TestFromJson();
    TestLoad(testRoot);
    TestEnvironment(testRoot);

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
