/**
 * @file ResponseEngine.hpp
 * @brief Entry point that turns one message into one reply.
 */

#pragma once

#include <memory>
#include <string>
#include "application/IntentDispatcher.hpp"

namespace logicchat::application {

/**
 * @class ResponseEngine
 * @brief Stateless orchestrator over the IntentDispatcher.
 *
 * Every call is classified and answered independently. The engine never
 * writes to the conversation log; recording the turn is the caller's job and
 * happens after the reply exists.
 */
class ResponseEngine {
public:
    explicit ResponseEngine(std::shared_ptr<IntentDispatcher> dispatcher);

    /**
     * @brief Produces the reply for a message. Never throws for any input.
     * @param text The user's message.
     * @return A non-empty reply.
     */
    std::string generateResponse(const std::string& text) const;

    const IntentDispatcher& dispatcher() const { return *m_dispatcher; }

private:
    std::shared_ptr<IntentDispatcher> m_dispatcher;
};

} // namespace logicchat::application
