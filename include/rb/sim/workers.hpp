#pragma once
/**
 * @file workers.hpp
 * @brief Exécution d’un lot de tâches sur des std::thread, avec join garanti.
 *
 * # Contrat
 * - `task(k)` est appelée une fois par worker k ∈ [0, n), chacune sur son thread.
 * - Tous les threads démarrés sont joints avant le retour, y compris quand la
 *   création d’un thread échoue (std::system_error) : l’exception est relancée
 *   après les joins, jamais de std::terminate sur un thread encore joignable.
 * - Une exception levée dans une tâche est capturée puis relancée après les
 *   joins (la première dans l’ordre des workers).
 */

#include <cstddef>
#include <functional>
#include <thread>

namespace rb {
namespace sim {

/// @brief Tâche d’un worker, reçoit son indice.
using WorkerTask = std::function<void(std::size_t)>;

/// @brief Fabrique de threads (std::thread par défaut ; remplaçable en test).
using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

/// @brief Lance n workers sur des std::thread et attend leur fin.
void run_workers(std::size_t n, const WorkerTask& task);

/// @brief Variante avec fabrique de threads injectée.
void run_workers(std::size_t n, const WorkerTask& task, const ThreadSpawner& spawn);

} // namespace sim
} // namespace rb
