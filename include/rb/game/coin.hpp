#pragma once
/**
 * @file coin.hpp
 * @brief Pile ou face biaisé.
 *
 * Un coup consomme exactement **un** tirage uniforme u ∈ [0,1) et gagne si u <= p.
 * Pour p <= 0 (perte sûre) et p >= 1 (gain sûr) le tirage est quand même
 * consommé, afin que deux runs de même graine restent alignés quel que soit p.
 */

#include <rb/core/uniform_rng.hpp>

namespace rb {
namespace game {

/// @brief Issue d’un coup.
enum class FlipOutcome {
  Win,
  Loss
};

/**
 * @brief Lance une pièce biaisée.
 * @param p   Probabilité de gain (supposée dans [0,1]).
 * @param rng Source uniforme (un tirage consommé).
 * @return FlipOutcome::Win si u <= p, Loss sinon.
 */
FlipOutcome coin_flip(double p, rb::core::UniformSource& rng);

/// @brief Variante booléenne : true = gain.
inline bool coin_flip_win(double p, rb::core::UniformSource& rng) {
  return coin_flip(p, rng) == FlipOutcome::Win;
}

} // namespace game
} // namespace rb
