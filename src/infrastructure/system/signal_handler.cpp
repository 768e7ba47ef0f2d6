// EN: Implementation of the SignalHandler
// FR: Implémentation du SignalHandler

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>
#include <string>

namespace DRX {

SignalHandler* SignalHandler::instance_ = nullptr;

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    instance_ = &instance;
    return instance;
}

SignalHandler::~SignalHandler() {
    if (initialized_.load()) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }
    instance_ = nullptr;
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_WARN("signal_handler", "SignalHandler already initialized");
        return;
    }

    if (std::signal(SIGINT, signalCallback) == SIG_ERR) {
        LOG_ERROR("signal_handler", "Failed to register SIGINT handler");
        throw std::runtime_error("Failed to register SIGINT handler");
    }
    if (std::signal(SIGTERM, signalCallback) == SIG_ERR) {
        LOG_ERROR("signal_handler", "Failed to register SIGTERM handler");
        // EN: Restore SIGINT handler before throwing
        // FR: Restaure le handler SIGINT avant de lancer l'exception
        std::signal(SIGINT, SIG_DFL);
        throw std::runtime_error("Failed to register SIGTERM handler");
    }

    initialized_ = true;
    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::restore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_.load()) {
        return;
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    initialized_ = false;
}

void SignalHandler::registerCancellationToken(CancellationToken* token) {
    token_.store(token);
}

void SignalHandler::triggerShutdown(int signal_number) {
    handleSignal(signal_number);
    LOG_WARN("signal_handler", "Shutdown requested by signal " + std::to_string(signal_number));
}

void SignalHandler::reset() {
    shutdown_requested_ = false;
    last_signal_ = 0;
    token_.store(nullptr);
}

void SignalHandler::signalCallback(int signal_number) {
    if (instance_) {
        instance_->handleSignal(signal_number);
    }
}

// EN: Runs in signal context: atomics only, no logging, no allocation.
// FR: S'exécute en contexte de signal : atomiques uniquement, ni log ni allocation.
void SignalHandler::handleSignal(int signal_number) {
    last_signal_.store(signal_number);
    shutdown_requested_.store(true);
    CancellationToken* token = token_.load();
    if (token) {
        token->cancel();
    }
}

} // namespace DRX
