#pragma once
/**
 * @file random_walk.hpp
 * @brief Marche aléatoire de la ruine du joueur (une partie = un essai Monte Carlo).
 *
 * # Automate d’une partie
 * États {Active, Busted, TargetReached}. Active est l’état initial ;
 * Busted et TargetReached sont absorbants.
 *   - Active → Busted        quand wealth <= 0
 *   - Active → TargetReached quand wealth >= target
 *   - Active → Active        sur un coup qui reste strictement dans (0, target)
 *
 * # Ordre test / mise à jour
 * "check-then-act" : l’état est testé **avant** chaque coup. Si une mise fait
 * dépasser une borne (mise qui ne divise pas la distance), la boucle sort au
 * test suivant et la richesse finale est ramenée dans [0, target].
 *
 * # Tolérance aux bornes
 * Les bornes sont testées à `BOUNDARY_EPS * bet` près, pour absorber la
 * dérive flottante d’un crédit bet*takehome non représentable exactement.
 *
 * # Tests recommandés
 * - p = 0 : w0/bet coups, richesse finale 0.
 * - p = 1, takehome = 1 : richesse finale = target.
 * - Départ sur une borne : 0 coup.
 */

#include <cstddef>   // std::size_t
#include <vector>

#include <rb/core/uniform_rng.hpp>
#include <rb/game/bet_params.hpp>

namespace rb {
namespace models {

/// @brief État d’une partie.
enum class WalkState {
  Active,        ///< Strictement entre 0 et target.
  Busted,        ///< Ruine (wealth <= 0).
  TargetReached  ///< Plafond atteint (wealth >= target).
};

/// @brief Tolérance relative (en unités de mise) du test aux bornes.
constexpr double BOUNDARY_EPS = 1e-9;

/// @brief Résultat d’une partie.
struct TrialResult {
  std::size_t steps;    ///< Nombre de coups joués.
  double final_wealth;  ///< Richesse finale (dans [0, target]).
  WalkState state;      ///< Busted / TargetReached, ou Active si tronquée par max_steps.
};

/// @brief Marche aléatoire à mise fixe entre 0 et target.
class RandomWalk {
public:
  /// @brief Construit une marche sur des paramètres validés.
  explicit RandomWalk(rb::game::BetParams params) noexcept : params_(params) {}

  /// @return Paramètres de la partie.
  const rb::game::BetParams& params() const noexcept { return params_; }

  /// @brief Classe une richesse selon l’automate (avec tolérance aux bornes).
  WalkState state(double wealth) const noexcept;

  /**
   * @brief Joue un coup : un pile ou face puis mise à jour de la richesse.
   * @return La nouvelle richesse (non bornée : le clamp se fait en fin de partie).
   */
  double step(double wealth, rb::core::UniformSource& rng) const;

  /**
   * @brief Joue une partie complète depuis `initial_wealth`.
   * @param rng       Source uniforme (un tirage par coup).
   * @param max_steps Plafond de coups (0 = illimité) ; au-delà la partie est
   *                  rendue dans l’état Active.
   * @param path      Si non nul, reçoit la trajectoire : richesse initiale,
   *                  puis une valeur par coup, la dernière étant la valeur bornée.
   */
  TrialResult run_trial(rb::core::UniformSource& rng,
                        std::size_t max_steps = 0,
                        std::vector<double>* path = nullptr) const;

private:
  double clamp_(double wealth) const noexcept;

  rb::game::BetParams params_;
};

/// @brief Libellé lisible d’un état ("active", "busted", "target").
const char* to_string(WalkState s) noexcept;

} // namespace models
} // namespace rb
