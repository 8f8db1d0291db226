/**
 * @file Turn.hpp
 * @brief Value Object for one persisted conversational exchange.
 */

#pragma once

#include <cstdint>
#include <string>

namespace logicchat::domain {

/**
 * @struct Turn
 * @brief A (user message, assistant reply) pair as recorded in the conversation log.
 *
 * Invariant: immutable once returned by a ConversationStore; ids are strictly
 * increasing in insertion order.
 */
struct Turn {
    std::int64_t id = 0;       ///< Assigned by the store.
    std::string timestamp;     ///< Capture time, ISO-8601 UTC.
    std::string userText;      ///< Message as received (trimmed).
    std::string aiText;        ///< Reply that was sent back.

    bool operator==(const Turn& other) const {
        return id == other.id &&
               timestamp == other.timestamp &&
               userText == other.userText &&
               aiText == other.aiText;
    }
};

} // namespace logicchat::domain
