/**
 * @file Bootstrap.cpp
 * @brief Implementation of the service wiring.
 */
#include "app/Bootstrap.hpp"

#include <iostream>
#include <stdexcept>
#include "infrastructure/FileConversationStore.hpp"

namespace logicchat::app {

LaunchOptions ParseArguments(int argc, char** argv) {
    LaunchOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--config requires a path");
            }
            options.configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return options;
}

application::AppServices BuildServices(const infrastructure::AppConfig& config,
                                       std::shared_ptr<domain::ConversationStore> store,
                                       domain::Clock clock) {
    domain::expression::ParserLimits limits;
    limits.maxLength = config.maxExpressionLength;
    limits.maxDepth = config.maxNestingDepth;

    application::AppServices services;
    services.conversationStore = std::move(store);
    services.intentDispatcher = std::make_shared<application::IntentDispatcher>(
        services.conversationStore, std::move(clock), limits, config.historyLimit);
    services.responseEngine = std::make_shared<application::ResponseEngine>(services.intentDispatcher);
    services.chatService = std::make_shared<application::ChatService>(
        services.responseEngine, services.conversationStore);
    return services;
}

application::AppServices BuildServices(const infrastructure::AppConfig& config) {
    auto logPath = config.logPath();
    auto store = std::make_shared<infrastructure::FileConversationStore>(
        logPath.string(), domain::SystemClock(), config.recallWindow);
    std::cout << "[Bootstrap] Conversation log: " << logPath.string()
              << " (" << store->fetchRecent(config.historyLimit).size() << " recent turns)" << std::endl;
    return BuildServices(config, store);
}

} // namespace logicchat::app
