#pragma once
/**
 * @file closed_form.hpp
 * @brief Formules fermées de la ruine du joueur (référence & tests).
 *
 * # Domaine
 * Valable pour takehome == 1 et une richesse initiale / un plafond multiples
 * de la mise. On note i = w0/bet, N = target/bet, q = 1 - p, r = q/p.
 *
 * # Formules
 *   P(plafond) = i/N                        si p = 1/2
 *              = (1 - r^i) / (1 - r^N)      sinon
 *   E[coups]   = i (N - i)                  si p = 1/2
 *              = i/(q-p) - N/(q-p) * P(plafond)  sinon
 *   E[richesse finale] = target * P(plafond)
 *
 * # Stabilité numérique
 * - Si r > 1, on réécrit P(plafond) avec s = 1/r pour éviter r^N = inf.
 * - p = 0 et p = 1 sont traités à part (r infini ou nul).
 */

namespace rb {
namespace game { struct BetParams; }

namespace analytic {

/// @brief Valeurs exactes d’une partie.
struct RuinClosedForm {
  double target_probability; ///< P(atteindre le plafond).
  double ruin_probability;   ///< P(ruine) = 1 - P(plafond).
  double expected_wealth;    ///< target * P(plafond).
  double expected_steps;     ///< Durée moyenne de la partie (en coups).
};

/// @return true si les formules fermées s’appliquent à ces paramètres.
bool closed_form_applies(const rb::game::BetParams& params) noexcept;

/**
 * @brief Valeurs exactes de la partie.
 * @throws std::invalid_argument si takehome != 1 ou si w0/target ne sont pas
 *         des multiples de la mise.
 */
RuinClosedForm closed_form(const rb::game::BetParams& params);

/**
 * @brief Probabilité d’atteindre N en partant de i (mise unitaire).
 * @param i Départ entier, 0 <= i <= N.
 * @param N Plafond entier (> 0).
 * @param p Probabilité de gain dans [0,1].
 */
double target_probability(long long i, long long N, double p) noexcept;

/// @brief Durée moyenne d’une partie partant de i (mise unitaire).
double expected_duration(long long i, long long N, double p) noexcept;

} // namespace analytic
} // namespace rb
