#include "app/ChatEndpoint.hpp"
#include <nlohmann/json.hpp>

namespace logicchat::app {

using json = nlohmann::json;

EndpointReply HandleChatRequest(application::ChatService& chat, const std::string& requestBody) {
    json request = json::parse(requestBody, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        return {400, json{{"error", "Invalid JSON body"}}.dump()};
    }

    std::string message;
    auto it = request.find("message");
    if (it != request.end() && it->is_string()) {
        message = it->get<std::string>();
    }

    auto reply = chat.handleMessage(message);
    json response = {{"response", reply.response}};
    return {200, response.dump(-1, ' ', false, json::error_handler_t::replace)};
}

} // namespace logicchat::app
