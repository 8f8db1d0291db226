#include "application/ResponseEngine.hpp"
#include <iostream>
#include <stdexcept>

namespace logicchat::application {

ResponseEngine::ResponseEngine(std::shared_ptr<IntentDispatcher> dispatcher)
    : m_dispatcher(std::move(dispatcher)) {
    if (!m_dispatcher) {
        throw std::invalid_argument("ResponseEngine: dispatcher cannot be null.");
    }
}

std::string ResponseEngine::generateResponse(const std::string& text) const {
    try {
        return m_dispatcher->dispatch(text).response;
    } catch (const std::exception& e) {
        std::cerr << "[ResponseEngine] Dispatch failed: " << e.what() << std::endl;
        return replies::kFallback;
    }
}

} // namespace logicchat::application
