/**
 * @file ConversationStore.hpp
 * @brief Interface for the append-only conversation log.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Turn.hpp"

namespace logicchat::domain {

/**
 * @class ConversationStore
 * @brief Abstract append-only log of conversation turns.
 *
 * Implementations serialize appends so that ids are race-free and strictly
 * increasing, and never expose a partially written turn to readers.
 * There is deliberately no update or delete operation.
 */
class ConversationStore {
public:
    virtual ~ConversationStore() = default;

    /**
     * @brief Records a new turn.
     * @param userText The user's message.
     * @param aiText The reply that was produced for it.
     * @return The stored turn with its assigned id and timestamp.
     * @throws std::runtime_error if the turn could not be persisted.
     */
    virtual Turn append(const std::string& userText, const std::string& aiText) = 0;

    /**
     * @brief Fetches the most recent turns.
     * @param limit Maximum number of turns; non-positive values yield an empty list.
     * @return Up to `limit` turns, oldest first.
     */
    virtual std::vector<Turn> fetchRecent(int limit) const = 0;

    /** @brief Releases the underlying resources. Further appends fail. */
    virtual void close() = 0;

    /** @brief Checks whether the store still accepts appends. */
    virtual bool isOpen() const = 0;
};

} // namespace logicchat::domain
