// EN: Signal handler for DR-Executor - SIGINT/SIGTERM cancel the running pipeline
// FR: Gestionnaire de signaux pour DR-Executor - SIGINT/SIGTERM annulent le pipeline en cours

#pragma once

#include <atomic>
#include <csignal>
#include <mutex>

#include "infrastructure/system/process_runner.hpp"

namespace DRX {

// EN: Routes termination signals to a registered cancellation token. The signal callback only
//     touches lock-free atomics; the process runner notices the token and kills the container
//     command it is waiting on.
// FR: Redirige les signaux de terminaison vers un jeton d'annulation enregistré. Le callback
//     ne touche que des atomiques sans verrou ; le lanceur de processus détecte le jeton et tue
//     la commande de conteneur en cours.
class SignalHandler {
public:
    // EN: Get the singleton instance
    // FR: Obtient l'instance singleton
    static SignalHandler& getInstance();

    // EN: Initialize signal handling (registers SIGINT, SIGTERM handlers)
    // FR: Initialise la gestion des signaux (enregistre les handlers SIGINT, SIGTERM)
    void initialize();

    // EN: Restore default dispositions for SIGINT and SIGTERM
    // FR: Restaure les dispositions par défaut de SIGINT et SIGTERM
    void restore();

    // EN: Token cancelled on the next signal. nullptr detaches the current one.
    // FR: Jeton annulé au prochain signal. nullptr détache le jeton courant.
    void registerCancellationToken(CancellationToken* token);

    // EN: Behave as if the signal had been delivered (useful for testing)
    // FR: Se comporte comme si le signal avait été reçu (utile pour les tests)
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const { return shutdown_requested_.load(); }
    int getLastSignal() const { return last_signal_.load(); }
    bool isInitialized() const { return initialized_.load(); }

    // EN: Reset the signal handler (mainly for testing)
    // FR: Remet à zéro le gestionnaire de signaux (principalement pour les tests)
    void reset();

    ~SignalHandler();

private:
    SignalHandler() = default;

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    // EN: Static signal handler function (C-style callback)
    // FR: Fonction gestionnaire de signaux statique (callback style C)
    static void signalCallback(int signal_number);

    void handleSignal(int signal_number);

    std::mutex mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::atomic<CancellationToken*> token_{nullptr};

    static SignalHandler* instance_;
};

} // namespace DRX
