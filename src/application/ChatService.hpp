/**
 * @file ChatService.hpp
 * @brief Boundary used by the transports: answer, then log.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "application/ResponseEngine.hpp"
#include "domain/ConversationStore.hpp"

namespace logicchat::application {

inline constexpr const char* kEmptyMessageReply = "Please provide a message.";

/**
 * @struct ChatReply
 * @brief What a transport sends back, plus whether the turn made it to the log.
 */
struct ChatReply {
    std::string response;
    std::optional<std::int64_t> turnId; ///< Empty when nothing was logged.
};

/**
 * @class ChatService
 * @brief Validates input, asks the engine for a reply, then appends the turn.
 *
 * A failed append is logged and reported through ChatReply::turnId; it never
 * changes the reply that was already generated.
 */
class ChatService {
public:
    ChatService(std::shared_ptr<ResponseEngine> engine,
                std::shared_ptr<domain::ConversationStore> store);

    /**
     * @brief Handles one raw message from a transport.
     * @param rawMessage Message as received; surrounding whitespace is ignored.
     */
    ChatReply handleMessage(const std::string& rawMessage);

private:
    std::shared_ptr<ResponseEngine> m_engine;
    std::shared_ptr<domain::ConversationStore> m_store;
};

} // namespace logicchat::application
