#include <rb/analytic/closed_form.hpp>

#include <rb/game/bet_params.hpp>

#include <algorithm>  // std::max
#include <cmath>      // std::expm1, std::exp, std::log, std::llround
#include <stdexcept>  // std::invalid_argument

namespace rb {
namespace analytic {

namespace {
// Écart à 1/2 en dessous duquel on prend la branche "jeu équitable".
constexpr double FAIR_EPS = 1e-12;
// Tolérance sur le caractère entier de w0/bet et target/bet.
constexpr double LATTICE_EPS = 1e-9;

inline bool is_lattice(double x, long long& out) noexcept {
  const double rounded = std::round(x);
  if (std::abs(x - rounded) > LATTICE_EPS * std::max(1.0, std::abs(x))) return false;
  out = std::llround(x);
  return true;
}
} // anonymous

double target_probability(long long i, long long N, double p) noexcept {
  if (i <= 0) return 0.0;
  if (i >= N) return 1.0;
  if (p <= 0.0) return 0.0;
  if (p >= 1.0) return 1.0;

  const double q = 1.0 - p;
  if (std::abs(p - 0.5) < FAIR_EPS) {
    return static_cast<double>(i) / static_cast<double>(N);
  }

  const double di = static_cast<double>(i);
  const double dN = static_cast<double>(N);
  const double log_r = std::log(q / p);

  if (log_r < 0.0) {
    // r < 1 : (1 - r^i) / (1 - r^N), via expm1 pour la précision près de r = 1.
    return std::expm1(di * log_r) / std::expm1(dN * log_r);
  }
  // r > 1 : s = 1/r, P = s^(N-i) * (1 - s^i) / (1 - s^N).
  const double log_s = -log_r;
  return std::exp((dN - di) * log_s) * std::expm1(di * log_s) / std::expm1(dN * log_s);
}

double expected_duration(long long i, long long N, double p) noexcept {
  if (i <= 0 || i >= N) return 0.0;
  if (p <= 0.0) return static_cast<double>(i);
  if (p >= 1.0) return static_cast<double>(N - i);

  const double di = static_cast<double>(i);
  const double dN = static_cast<double>(N);
  if (std::abs(p - 0.5) < FAIR_EPS) {
    return di * (dN - di);
  }
  const double q = 1.0 - p;
  return di / (q - p) - dN / (q - p) * target_probability(i, N, p);
}

bool closed_form_applies(const rb::game::BetParams& params) noexcept {
  if (std::abs(params.takehome - 1.0) > FAIR_EPS) return false;
  long long i = 0, N = 0;
  return is_lattice(params.initial_wealth / params.bet, i) &&
         is_lattice(params.target / params.bet, N);
}

RuinClosedForm closed_form(const rb::game::BetParams& params) {
  if (std::abs(params.takehome - 1.0) > FAIR_EPS) {
    throw std::invalid_argument("closed_form: requires takehome == 1");
  }
  long long i = 0, N = 0;
  if (!is_lattice(params.initial_wealth / params.bet, i) ||
      !is_lattice(params.target / params.bet, N)) {
    throw std::invalid_argument("closed_form: initial_wealth and target must be multiples of bet");
  }

  const double pt = target_probability(i, N, params.p);

  RuinClosedForm out{};
  out.target_probability = pt;
  out.ruin_probability   = 1.0 - pt;
  out.expected_wealth    = params.target * pt;
  out.expected_steps     = expected_duration(i, N, params.p);
  return out;
}

} // namespace analytic
} // namespace rb
