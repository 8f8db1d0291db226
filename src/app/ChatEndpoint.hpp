/**
 * @file ChatEndpoint.hpp
 * @brief JSON framing for the /chat route, independent of the HTTP library.
 */
#pragma once

#include <string>
#include "application/ChatService.hpp"

namespace logicchat::app {

struct EndpointReply {
    int status = 200;
    std::string body; ///< JSON document.
};

/**
 * @brief Handles a /chat request body: {"message": "..."} -> {"response": "..."}.
 *
 * The body is parsed as JSON regardless of its declared content type. A body
 * that is not a JSON object yields 400 with {"error": ...}. A missing or
 * non-string "message" counts as an empty message.
 */
EndpointReply HandleChatRequest(application::ChatService& chat, const std::string& requestBody);

} // namespace logicchat::app
