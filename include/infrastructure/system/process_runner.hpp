// EN: Process runner for DR-Executor - starts external commands, feeds stdin, captures output
// FR: Lanceur de processus pour DR-Executor - démarre les commandes externes, fournit stdin, capture la sortie

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace DRX {

// EN: Cooperative cancellation flag shared between the caller and running operations.
// FR: Drapeau d'annulation coopérative partagé entre l'appelant et les opérations en cours.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// EN: Per-operation limits. A zero timeout means no limit.
// FR: Limites par opération. Un timeout nul signifie aucune limite.
struct ExecutionOptions {
    std::chrono::milliseconds timeout{0};
    const CancellationToken* cancellation = nullptr;

    bool isCancelled() const { return cancellation != nullptr && cancellation->isCancelled(); }
};

// EN: What to start and how.
// FR: Quoi démarrer et comment.
struct CommandSpec {
    std::vector<std::string> argv;         // EN: argv[0] is resolved through PATH / FR: argv[0] est résolu via PATH
    std::string working_directory;         // EN: Empty keeps the current directory / FR: Vide conserve le répertoire courant
    std::string stdin_data;                // EN: Written to the child's stdin, then closed / FR: Écrit sur stdin de l'enfant puis fermé
};

// EN: Outcome of one process invocation.
// FR: Résultat d'une invocation de processus.
struct ProcessResult {
    bool started = false;       // EN: False when fork/chdir/exec failed / FR: Faux si fork/chdir/exec a échoué
    bool exited = false;        // EN: Normal exit, exit_code is valid / FR: Sortie normale, exit_code est valide
    int exit_code = 0;
    bool signaled = false;      // EN: Terminated by a signal / FR: Terminé par un signal
    int term_signal = 0;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_data;
    std::string stderr_data;
    std::string error;          // EN: Runner-side error, not the child's stderr / FR: Erreur du lanceur, pas le stderr de l'enfant
};

// EN: Seam between the executors and the operating system, mocked in tests.
// FR: Interface entre les exécuteurs et le système, simulée dans les tests.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual ProcessResult run(const CommandSpec& spec, const ExecutionOptions& options) = 0;
};

// EN: fork/execvp implementation. Start failures (missing binary, missing working directory)
//     are reported through a close-on-exec pipe so they are never confused with exit code 127.
// FR: Implémentation fork/execvp. Les échecs de démarrage (binaire ou répertoire absent) passent
//     par un pipe close-on-exec pour ne jamais être confondus avec le code 127.
class PosixCommandRunner : public CommandRunner {
public:
    PosixCommandRunner();

    ProcessResult run(const CommandSpec& spec, const ExecutionOptions& options) override;

private:
    std::chrono::milliseconds poll_slice_{50};
};

// EN: Current process environment as KEY=VALUE strings.
// FR: Environnement du processus courant sous forme KEY=VALUE.
std::vector<std::string> environmentSnapshot();

// EN: argv joined with single spaces, as recorded in CmdResult::cmd.
// FR: argv joint par des espaces simples, tel qu'enregistré dans CmdResult::cmd.
std::string joinCommandLine(const std::vector<std::string>& argv);

} // namespace DRX
