/**
 * @file ChatServer.cpp
 * @brief Implementation of ChatServer.
 */
#include "app/ChatServer.hpp"

#include <httplib.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include "app/ChatEndpoint.hpp"

namespace logicchat::app {

namespace fs = std::filesystem;

ChatServer::ChatServer(std::shared_ptr<application::ChatService> chat, infrastructure::AppConfig config)
    : m_chat(std::move(chat)), m_config(std::move(config)), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

ChatServer::~ChatServer() {
    stop();
}

void ChatServer::registerRoutes() {
    fs::path staticDir(m_config.staticDir);
    if (fs::exists(staticDir)) {
        if (!m_server->set_mount_point("/static", staticDir.string())) {
            std::cerr << "[ChatServer] Could not mount static directory: " << staticDir << std::endl;
        }
    } else {
        std::cerr << "[ChatServer] Static directory not found: " << staticDir << std::endl;
    }

    m_server->Get("/", [staticDir](const httplib::Request&, httplib::Response& res) {
        std::ifstream page(staticDir / "index.html", std::ios::binary);
        if (!page) {
            res.status = 404;
            res.set_content("Chat page not found.", "text/plain");
            return;
        }
        std::stringstream buffer;
        buffer << page.rdbuf();
        res.set_content(buffer.str(), "text/html; charset=utf-8");
    });

    m_server->Post("/chat", [this](const httplib::Request& req, httplib::Response& res) {
        auto reply = HandleChatRequest(*m_chat, req.body);
        res.status = reply.status;
        res.set_content(reply.body, "application/json");
    });

    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        }
        std::cerr << "[ChatServer] " << req.method << " " << req.path << " failed: " << what << std::endl;
        res.status = 500;
        res.set_content(R"({"error": "Internal server error"})", "application/json");
    });
}

bool ChatServer::start() {
    std::cout << "[ChatServer] Listening on http://" << m_config.host << ":" << m_config.port << std::endl;
    if (!m_server->listen(m_config.host, m_config.port)) {
        std::cerr << "[ChatServer] Failed to listen on " << m_config.host << ":" << m_config.port << std::endl;
        return false;
    }
    return true;
}

void ChatServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

} // namespace logicchat::app
