#include <rb/analytic/closed_form.hpp>
#include <rb/game/bet_params.hpp>

#include <algorithm>
#include <cmath>
#include <cassert>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

using rb::analytic::target_probability;
using rb::analytic::expected_duration;
using rb::game::BetParams;

int main() {
  // 1) Jeu équitable : P = i/N, E[T] = i (N - i)
  for (long long i = 0; i <= 40; ++i) {
    assert(std::abs(target_probability(i, 40, 0.5) - static_cast<double>(i) / 40.0) < 1e-15);
    assert(std::abs(expected_duration(i, 40, 0.5) - static_cast<double>(i * (40 - i))) < 1e-9);
  }

  // 2) Équations de récurrence : P(i) = p P(i+1) + q P(i-1), D(i) = 1 + p D(i+1) + q D(i-1)
  for (double p : {0.3, 0.45, 0.49, 0.55, 0.7}) {
    const double q = 1.0 - p;
    const long long N = 30;
    for (long long i = 1; i < N; ++i) {
      const double P  = target_probability(i, N, p);
      const double Pr = p * target_probability(i + 1, N, p) + q * target_probability(i - 1, N, p);
      assert(std::abs(P - Pr) < 1e-12);

      const double D  = expected_duration(i, N, p);
      const double Dr = 1.0 + p * expected_duration(i + 1, N, p) + q * expected_duration(i - 1, N, p);
      assert(std::abs(D - Dr) < 1e-8 * std::max(1.0, D));
    }
  }

  // 3) p = 0 / p = 1
  assert(target_probability(7, 10, 0.0) == 0.0);
  assert(expected_duration(7, 10, 0.0) == 7.0);
  assert(target_probability(7, 10, 1.0) == 1.0);
  assert(expected_duration(7, 10, 1.0) == 3.0);

  // 4) Continuité au voisinage de p = 1/2
  assert(std::abs(target_probability(20, 40, 0.5 + 1e-7) - 0.5) < 1e-4);
  assert(std::abs(expected_duration(20, 40, 0.5 + 1e-7) - 400.0) < 1e-2);

  // 5) Grand N, r > 1 : pas d’overflow
  const double big = target_probability(1000, 2000, 0.3);
  assert(std::isfinite(big) && big >= 0.0 && big < 1e-100);
  const double big_up = target_probability(1000, 2000, 0.7);
  assert(std::isfinite(big_up) && std::abs(big_up - 1.0) < 1e-12);
  assert(std::isfinite(expected_duration(1000, 2000, 0.3)));

  // 6) Mise non unitaire : w0 = 10, bet = 2, target = 50 ⇒ i = 5, N = 25
  const BetParams scaled(10, 2, 50, 0.45, 1.0);
  assert(rb::analytic::closed_form_applies(scaled));
  const auto cf = rb::analytic::closed_form(scaled);
  assert(std::abs(cf.target_probability - target_probability(5, 25, 0.45)) < 1e-15);
  assert(std::abs(cf.expected_wealth - 50.0 * cf.target_probability) < 1e-12);
  assert(std::abs(cf.ruin_probability + cf.target_probability - 1.0) < 1e-15);
  assert(std::abs(cf.expected_steps - expected_duration(5, 25, 0.45)) < 1e-12);

  // 7) Hors domaine : takehome != 1, ou hors réseau de la mise
  const BetParams vig(10, 1, 20, 0.5, 0.9);
  assert(!rb::analytic::closed_form_applies(vig));
  bool threw = false;
  try { rb::analytic::closed_form(vig); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  const BetParams off(10, 3, 20, 0.5, 1.0);
  assert(!rb::analytic::closed_form_applies(off));
  threw = false;
  try { rb::analytic::closed_form(off); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  std::cout << "Closed form OK.\n";
  return 0;
}
