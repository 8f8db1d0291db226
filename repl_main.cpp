#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "app/Bootstrap.hpp"
#include "app/ConsoleApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace logicchat;

int main(int argc, char** argv) {
    app::LaunchOptions options;
    try {
        options = app::ParseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[repl] " << e.what() << std::endl;
        return 2;
    }
    if (options.showHelp) {
        std::cout << "Usage: logicchat_repl [--config settings.json]\n"
                  << "Type a message per line; 'quit' or 'exit' to leave.\n";
        return 0;
    }

    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(options.configPath);

    application::AppServices services;
    try {
        std::filesystem::create_directories(config.dataDir);
        services = app::BuildServices(config);
    } catch (const std::exception& e) {
        std::cerr << "[repl] Startup failed: " << e.what() << std::endl;
        return 1;
    }

    app::ConsoleApp console(services.chatService);
    console.run(std::cin, std::cout);

    services.conversationStore->close();
    return 0;
}
