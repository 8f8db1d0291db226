/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ChatService.hpp"
#include "application/IntentDispatcher.hpp"
#include "application/ResponseEngine.hpp"
#include "domain/ConversationStore.hpp"

namespace logicchat::application {

struct AppServices {
    std::shared_ptr<domain::ConversationStore> conversationStore;
    std::shared_ptr<IntentDispatcher> intentDispatcher;
    std::shared_ptr<ResponseEngine> responseEngine;
    std::shared_ptr<ChatService> chatService;
};

} // namespace logicchat::application
