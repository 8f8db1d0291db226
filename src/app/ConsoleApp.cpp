#include "app/ConsoleApp.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace logicchat::app {

ConsoleApp::ConsoleApp(std::shared_ptr<application::ChatService> chat) : m_chat(std::move(chat)) {}

int ConsoleApp::run(std::istream& in, std::ostream& out, const std::string& prompt) {
    int answered = 0;
    std::string line;
    while (true) {
        if (!prompt.empty()) out << prompt << std::flush;
        if (!std::getline(in, line)) break;
        if (line == "quit" || line == "exit") break;

        auto reply = m_chat->handleMessage(line);
        out << reply.response << "\n";
        ++answered;
    }
    return answered;
}

} // namespace logicchat::app
