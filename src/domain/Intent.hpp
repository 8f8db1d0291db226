/**
 * @file Intent.hpp
 * @brief Classification tags assigned to incoming messages.
 */

#pragma once

#include <string>

namespace logicchat::domain {

/**
 * @enum Intent
 * @brief Exactly one intent is assigned per message.
 */
enum class Intent {
    Arithmetic,     ///< Digit and operator present; try the expression evaluator.
    DateQuery,      ///< Asks for today's date.
    TimeQuery,      ///< Asks for the current time.
    HistoryRecall,  ///< Asks about earlier turns.
    SelfIdentify,   ///< Asks what the assistant is.
    Fallback        ///< Nothing else matched.
};

/**
 * @brief Helper to convert an intent to string for display/logging.
 */
inline std::string IntentToString(Intent intent) {
    switch (intent) {
        case Intent::Arithmetic: return "Arithmetic";
        case Intent::DateQuery: return "DateQuery";
        case Intent::TimeQuery: return "TimeQuery";
        case Intent::HistoryRecall: return "HistoryRecall";
        case Intent::SelfIdentify: return "SelfIdentify";
        case Intent::Fallback: return "Fallback";
    }
    return "Unknown";
}

} // namespace logicchat::domain
