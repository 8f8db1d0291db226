/**
 * @file AppConfig.hpp
 * @brief Value Object holding process configuration.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace logicchat::infrastructure {

/**
 * @struct AppConfig
 * @brief Settings for the server, the console and the conversation log.
 *
 * Invariant: port in 1..65535, positive limits.
 */
struct AppConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
    std::string dataDir = "data";
    std::string logFile = "conversation.ndjson"; ///< Relative to dataDir unless absolute.
    std::string staticDir = "static";
    int historyLimit = 10;
    std::size_t maxExpressionLength = 512;
    int maxNestingDepth = 64;
    std::size_t recallWindow = 256; ///< Recent turns the file store keeps in memory.

    void validate() const {
        if (port < 1 || port > 65535) {
            throw std::invalid_argument("AppConfig: port must be between 1 and 65535.");
        }
        if (historyLimit <= 0) {
            throw std::invalid_argument("AppConfig: history_limit must be positive.");
        }
        if (maxExpressionLength == 0) {
            throw std::invalid_argument("AppConfig: max_expression_length must be positive.");
        }
        if (maxNestingDepth <= 0) {
            throw std::invalid_argument("AppConfig: max_nesting_depth must be positive.");
        }
        if (recallWindow == 0) {
            throw std::invalid_argument("AppConfig: recall_window must be positive.");
        }
        if (logFile.empty()) {
            throw std::invalid_argument("AppConfig: log_file cannot be empty.");
        }
    }

    /** @brief Full path of the conversation log. */
    std::filesystem::path logPath() const {
        std::filesystem::path file(logFile);
        if (file.is_absolute()) return file;
        return std::filesystem::path(dataDir) / file;
    }
};

} // namespace logicchat::infrastructure
