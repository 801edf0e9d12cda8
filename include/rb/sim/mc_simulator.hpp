#pragma once
/**
 * @file mc_simulator.hpp
 * @brief Orchestrateur Monte Carlo de la ruine du joueur.
 *
 * # Principe
 * - N parties indépendantes de `models::RandomWalk`.
 * - Accumulation en ligne (RunningStats) de la richesse finale et du nombre
 *   de coups ; pas de stockage des parties (sauf la trajectoire de la dernière,
 *   sur demande).
 * - Espérances = moyennes arithmétiques sur toutes les parties jouées.
 *
 * # Lots & parallélisme
 * - Les parties sont jouées par lots de `batch_size`.
 * - Avec `n_threads > 1`, chaque lot est réparti entre les workers ; chaque
 *   worker possède son propre flux (derive_seed(seed, k)) et ses accumulateurs
 *   partiels, fusionnés dans l’ordre des workers après le join.
 *
 * # Convergence & arrêt
 * - Un point (n_cum, richesse espérée, demi-largeur 95 %, coups espérés) par lot.
 * - `tolerance > 0` : arrêt anticipé dès que l’erreur standard de la richesse
 *   espérée < tolerance.
 * - Un observateur de lot peut renvoyer false pour interrompre le run.
 */

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include <rb/config/sim_config.hpp>
#include <rb/core/stats.hpp>
#include <rb/core/uniform_rng.hpp>
#include <rb/game/bet_params.hpp>
#include <rb/models/random_walk.hpp>

namespace rb {
namespace sim {

/// @brief Un point du journal de convergence (après un cumul de parties).
struct ConvergencePoint {
  std::size_t n_cum;          ///< Nombre cumulé de parties.
  double expected_wealth;     ///< Richesse finale moyenne courante.
  double half_width_95;       ///< Demi-largeur de l’IC 95 % sur la richesse.
  double expected_steps;      ///< Nombre moyen de coups courant.
};

/// @brief Résultat d’un run Monte Carlo.
struct SimulationResult {
  double expected_wealth;     ///< Richesse finale espérée.
  double wealth_std_error;    ///< Erreur standard de la richesse espérée.
  double wealth_ci_low;       ///< Borne basse de l’IC 95 %.
  double wealth_ci_high;      ///< Borne haute de l’IC 95 %.
  double expected_steps;      ///< Nombre de coups espéré.
  double steps_std_error;     ///< Erreur standard du nombre de coups espéré.
  std::size_t max_steps_seen; ///< Plus longue partie observée.

  std::size_t n_trials;       ///< Parties effectivement jouées.
  std::size_t n_busted;       ///< Parties terminées ruinées.
  std::size_t n_target;       ///< Parties terminées au plafond.
  std::size_t n_truncated;    ///< Parties interrompues par max_steps.
  double ruin_probability;    ///< n_busted / n_trials.
  double target_probability;  ///< n_target / n_trials.

  bool stopped_early;         ///< Interrompu par l’observateur de lot.
  long long elapsed_ms;       ///< Durée de la simulation (millisecondes).

  std::vector<ConvergencePoint> convergence_log; ///< Vide si désactivé.
  std::vector<double> last_path;                 ///< Vide si record_last_path == false.
};

/**
 * @brief Monte Carlo sur la marche de ruine.
 *
 * Le simulateur est sans état entre deux appels à `run` : deux runs de même
 * configuration produisent le même résultat.
 */
class McSimulator {
public:
  /// @brief Appelé après chaque lot ; renvoyer false interrompt le run.
  using BatchObserver = std::function<bool(const ConvergencePoint&)>;

  /// @throws std::invalid_argument si n_trials, batch_size ou n_threads vaut 0.
  explicit McSimulator(rb::config::SimConfig cfg);

  /// @brief Active/désactive le journal de convergence (par lot).
  void enable_convergence_log(bool on) noexcept { log_enabled_ = on; }

  /// @brief Installe (ou retire, si vide) l’observateur de lot.
  void set_batch_observer(BatchObserver obs) { observer_ = std::move(obs); }

  /// @brief Run complet, RNG internes graines depuis la configuration.
  SimulationResult run(const rb::game::BetParams& params) const;

  /**
   * @brief Run séquentiel sur une source injectée (n_threads ignoré).
   *
   * Sert au replay déterministe (SequenceRng) et aux tests.
   */
  SimulationResult run(const rb::game::BetParams& params,
                       rb::core::UniformSource& rng) const;

  /// @return Configuration Monte Carlo utilisée.
  const rb::config::SimConfig& config() const noexcept { return cfg_; }

private:
  SimulationResult run_streams_(const rb::game::BetParams& params,
                                const std::vector<rb::core::UniformSource*>& streams) const;

  rb::config::SimConfig cfg_;
  bool log_enabled_{false};
  BatchObserver observer_;
};

/**
 * @brief Moyenne Monte Carlo "nue" : n_trials parties sur une source donnée.
 * @throws std::invalid_argument si n_trials == 0.
 */
SimulationResult monte_carlo_average(const rb::game::BetParams& params,
                                     std::size_t n_trials,
                                     rb::core::UniformSource& rng);

} // namespace sim
} // namespace rb
