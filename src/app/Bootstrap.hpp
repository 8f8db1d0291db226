/**
 * @file Bootstrap.hpp
 * @brief Wires configuration, the conversation log and the services together.
 */
#pragma once

#include <string>
#include "application/AppServices.hpp"
#include "domain/Clock.hpp"
#include "infrastructure/AppConfig.hpp"

namespace logicchat::app {

/** @brief Parsed command line shared by the executables. */
struct LaunchOptions {
    std::string configPath = "settings.json";
    bool showHelp = false;
};

/**
 * @brief Reads --config <path> and --help.
 * @throws std::invalid_argument on unknown or incomplete arguments.
 */
LaunchOptions ParseArguments(int argc, char** argv);

/**
 * @brief Opens the file-backed log and builds every service.
 * @throws std::runtime_error if the log cannot be opened.
 */
application::AppServices BuildServices(const infrastructure::AppConfig& config);

/**
 * @brief Builds services over an arbitrary store (tests use the in-memory one).
 */
application::AppServices BuildServices(const infrastructure::AppConfig& config,
                                       std::shared_ptr<domain::ConversationStore> store,
                                       domain::Clock clock = domain::SystemClock());

} // namespace logicchat::app
