#include <rb/models/random_walk.hpp>

#include <rb/game/coin.hpp>

namespace rb {
namespace models {

WalkState RandomWalk::state(double wealth) const noexcept {
  const double eps = BOUNDARY_EPS * params_.bet;
  if (wealth <= eps) return WalkState::Busted;
  if (wealth >= params_.target - eps) return WalkState::TargetReached;
  return WalkState::Active;
}

double RandomWalk::step(double wealth, rb::core::UniformSource& rng) const {
  if (rb::game::coin_flip(params_.p, rng) == rb::game::FlipOutcome::Win) {
    return wealth + params_.win_amount();
  }
  return wealth - params_.bet;
}

double RandomWalk::clamp_(double wealth) const noexcept {
  switch (state(wealth)) {
    case WalkState::Busted:        return 0.0;
    case WalkState::TargetReached: return params_.target;
    case WalkState::Active:        break;
  }
  return wealth;
}

TrialResult RandomWalk::run_trial(rb::core::UniformSource& rng,
                                  std::size_t max_steps,
                                  std::vector<double>* path) const {
  double wealth = params_.initial_wealth;
  std::size_t steps = 0;

  if (path) {
    path->clear();
    path->push_back(clamp_(wealth));
  }

  WalkState s = state(wealth);
  while (s == WalkState::Active) {
    if (max_steps > 0 && steps >= max_steps) break; // partie tronquée
    wealth = step(wealth, rng);
    ++steps;
    s = state(wealth);
    if (path) path->push_back(clamp_(wealth));
  }

  return TrialResult{ steps, clamp_(wealth), s };
}

const char* to_string(WalkState s) noexcept {
  switch (s) {
    case WalkState::Active:        return "active";
    case WalkState::Busted:        return "busted";
    case WalkState::TargetReached: return "target";
  }
  return "unknown";
}

} // namespace models
} // namespace rb
