/**
 * @file ConsoleApp.hpp
 * @brief Line-oriented front end over ChatService.
 */
#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include "application/ChatService.hpp"

namespace logicchat::app {

/**
 * @class ConsoleApp
 * @brief Reads one message per line and prints each reply. "quit", "exit"
 * or end of input ends the session.
 */
class ConsoleApp {
public:
    explicit ConsoleApp(std::shared_ptr<application::ChatService> chat);

    /**
     * @brief Runs the read-reply loop.
     * @param prompt Printed before each read; empty for scripted input.
     * @return Number of messages answered.
     */
    int run(std::istream& in, std::ostream& out, const std::string& prompt = "> ");

private:
    std::shared_ptr<application::ChatService> m_chat;
};

} // namespace logicchat::app
