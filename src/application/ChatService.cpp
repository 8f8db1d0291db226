/**
 * @file ChatService.cpp
 * @brief Implementation of ChatService.
 */

#include "application/ChatService.hpp"
#include <iostream>
#include <stdexcept>

namespace logicchat::application {

namespace {

std::string Trim(const std::string& s) {
    const char* blanks = " \t\n\r\f\v";
    auto first = s.find_first_not_of(blanks);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(blanks);
    return s.substr(first, last - first + 1);
}

} // namespace

ChatService::ChatService(std::shared_ptr<ResponseEngine> engine,
                         std::shared_ptr<domain::ConversationStore> store)
    : m_engine(std::move(engine)), m_store(std::move(store)) {
    if (!m_engine) {
        throw std::invalid_argument("ChatService: engine cannot be null.");
    }
}

ChatReply ChatService::handleMessage(const std::string& rawMessage) {
    const std::string message = Trim(rawMessage);
    if (message.empty()) {
        return {kEmptyMessageReply, std::nullopt};
    }

    ChatReply reply{m_engine->generateResponse(message), std::nullopt};

    if (!m_store) {
        return reply;
    }
    try {
        reply.turnId = m_store->append(message, reply.response).id;
    } catch (const std::exception& e) {
        std::cerr << "[ChatService] Failed to log turn: " << e.what() << std::endl;
    }
    return reply;
}

} // namespace logicchat::application
