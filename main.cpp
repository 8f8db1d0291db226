#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "app/Bootstrap.hpp"
#include "app/ChatServer.hpp"
#include "app/ShutdownSignal.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace logicchat;

namespace {

void PrintUsage() {
    std::cout << "Usage: logicchat_server [--config settings.json]\n"
              << "Serves the chat page on / and answers POST /chat.\n";
}

} // namespace

int main(int argc, char** argv) {
    app::LaunchOptions options;
    try {
        options = app::ParseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[main] " << e.what() << std::endl;
        PrintUsage();
        return 2;
    }
    if (options.showHelp) {
        PrintUsage();
        return 0;
    }

    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(options.configPath);

    application::AppServices services;
    try {
        std::filesystem::create_directories(config.dataDir);
        services = app::BuildServices(config);
    } catch (const std::exception& e) {
        std::cerr << "[main] Startup failed: " << e.what() << std::endl;
        return 1;
    }

    app::ChatServer server(services.chatService, config);
    app::InstallShutdownHandlers();
    std::atomic<bool> serving{true};
    std::thread watcher([&server, &serving]() {
        app::WaitForShutdown();
        // A stop that lands before listen() begins is lost, so repeat until start() returns.
        while (serving) {
            server.stop();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    bool ok = server.start();

    serving = false;
    app::RequestShutdown();
    watcher.join();
    services.conversationStore->close();
    std::cout << "[main] Shutdown complete." << std::endl;
    return ok ? 0 : 1;
}
