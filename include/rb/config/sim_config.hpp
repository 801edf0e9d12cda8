#pragma once
/**
 * @file sim_config.hpp
 * @brief Configuration standard d’un run Monte Carlo de ruine du joueur.
 *
 * # Contenu
 * - n_trials         : nombre de parties à simuler (>= 1).
 * - batch_size       : parties par lot (>= 1) ; un point de convergence par lot.
 * - tolerance        : précision cible sur l’erreur standard de la richesse
 *                      espérée. Si <= 0 ⇒ désactivé.
 * - seed             : graine maître du RNG (le worker k utilise derive_seed(seed, k)).
 * - n_threads        : nombre de workers (>= 1) ; 1 = séquentiel.
 * - max_steps        : plafond de coups par partie (0 = illimité).
 * - record_last_path : conserve la trajectoire de la dernière partie.
 *
 * # Logique d’arrêt
 * - Si tolerance > 0 : arrêt anticipé en fin de lot lorsque l’erreur standard
 *   < tolerance, ou après n_trials parties.
 * - Si tolerance <= 0 : toujours simuler n_trials parties.
 *
 * # Reproductibilité
 * Résultat identique pour un même triplet (seed, n_threads, batch_size).
 */

#include <cstddef>   // std::size_t
#include <cstdint>   // std::uint64_t

namespace rb {
namespace config {

/// @brief Configuration d’un run Monte Carlo.
struct SimConfig {
  std::size_t   n_trials;        ///< Nombre de parties.
  std::size_t   batch_size;      ///< Taille d’un lot.
  double        tolerance;       ///< Précision cible (<=0 désactive).
  std::uint64_t seed;            ///< Graine maître.
  std::size_t   n_threads;       ///< Nombre de workers.
  std::size_t   max_steps;       ///< Plafond de coups par partie (0 = illimité).
  bool          record_last_path;///< Garde la trajectoire de la dernière partie.

  /// @brief Construit une configuration avec valeurs par défaut.
  SimConfig(std::size_t n_trials = 1000,
            std::size_t batch_size = 1000,
            double      tolerance = -1.0,
            std::uint64_t seed = 42ULL,
            std::size_t n_threads = 1,
            std::size_t max_steps = 0,
            bool record_last_path = false) noexcept
      : n_trials(n_trials),
        batch_size(batch_size),
        tolerance(tolerance),
        seed(seed),
        n_threads(n_threads),
        max_steps(max_steps),
        record_last_path(record_last_path) {}
};

} // namespace config
} // namespace rb
