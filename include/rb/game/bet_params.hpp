#pragma once
/**
 * @file bet_params.hpp
 * @brief Paramètres d’une partie de ruine du joueur.
 *
 * # Contenu
 * - initial_wealth : richesse de départ (>= 0, <= target).
 * - bet            : mise fixe par coup (> 0).
 * - target         : plafond absorbant (> 0).
 * - p              : probabilité de gain d’un coup, dans [0,1] (défaut 0.5).
 * - takehome       : fraction de la mise créditée sur un gain (> 0, défaut 1).
 *
 * # Règle d’un coup
 * - gain  : wealth += bet * takehome
 * - perte : wealth -= bet
 *
 * # Cas limites acceptés
 * initial_wealth == 0 ou initial_wealth == target : la partie est déjà
 * terminée (0 coup joué).
 */

#include <cmath>     // std::isfinite
#include <stdexcept> // std::invalid_argument

namespace rb {
namespace game {

/**
 * @brief Paramètres validés d’une partie.
 *
 * Immuables après construction.
 */
struct BetParams {
public:
  const double initial_wealth; ///< Richesse initiale (0 <= w0 <= target).
  const double bet;            ///< Mise par coup (> 0).
  const double target;         ///< Plafond absorbant (> 0).
  const double p;              ///< Probabilité de gain, dans [0,1].
  const double takehome;       ///< Fraction de la mise créditée sur un gain (> 0).

  /// @throws std::invalid_argument si un paramètre est hors domaine ou non fini.
  BetParams(double initial_wealth, double bet, double target,
            double p = 0.5, double takehome = 1.0)
      : initial_wealth(initial_wealth), bet(bet), target(target),
        p(p), takehome(takehome) {
    if (!std::isfinite(initial_wealth) || !std::isfinite(bet) ||
        !std::isfinite(target) || !std::isfinite(p) || !std::isfinite(takehome)) {
      throw std::invalid_argument("BetParams: all parameters must be finite");
    }
    if (bet <= 0.0) {
      throw std::invalid_argument("BetParams: bet must be > 0");
    }
    if (target <= 0.0) {
      throw std::invalid_argument("BetParams: target must be > 0");
    }
    if (initial_wealth < 0.0 || initial_wealth > target) {
      throw std::invalid_argument("BetParams: initial_wealth must lie in [0, target]");
    }
    if (p < 0.0 || p > 1.0) {
      throw std::invalid_argument("BetParams: p must lie in [0,1]");
    }
    if (takehome <= 0.0) {
      throw std::invalid_argument("BetParams: takehome must be > 0");
    }
  }

  /// @return Crédit d’un coup gagnant (bet * takehome).
  double win_amount() const noexcept { return bet * takehome; }
};

} // namespace game
} // namespace rb
