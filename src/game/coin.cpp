#include <rb/game/coin.hpp>

namespace rb {
namespace game {

FlipOutcome coin_flip(double p, rb::core::UniformSource& rng) {
  const double u = rng.uniform();
  if (p <= 0.0) return FlipOutcome::Loss;
  if (p >= 1.0) return FlipOutcome::Win;
  return (u <= p) ? FlipOutcome::Win : FlipOutcome::Loss;
}

} // namespace game
} // namespace rb
