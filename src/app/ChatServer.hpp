/**
 * @file ChatServer.hpp
 * @brief HTTP transport: static chat page plus the /chat JSON route.
 */
#pragma once

#include <memory>
#include <string>
#include "application/ChatService.hpp"
#include "infrastructure/AppConfig.hpp"

namespace httplib {
class Server;
}

namespace logicchat::app {

class ChatServer {
public:
    ChatServer(std::shared_ptr<application::ChatService> chat, infrastructure::AppConfig config);
    ~ChatServer();

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    /**
     * @brief Binds and serves until stop() is called.
     * @return False if the socket could not be bound.
     */
    bool start();

    /** @brief Stops a running start() loop. Safe to call from another thread. */
    void stop();

private:
    void registerRoutes();

    std::shared_ptr<application::ChatService> m_chat;
    infrastructure::AppConfig m_config;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace logicchat::app
