#include <rb/game/coin.hpp>
#include <rb/core/uniform_rng.hpp>
#include <rb/core/stats.hpp>

#include <iostream>
#include <iomanip>
#include <cmath>
#include <cstdlib>
#include <string>

int main(int argc, char** argv) {
  if (argc != 4) {
    std::cerr << "Usage: " << argv[0] << " p seed N\n";
    return 1;
  }
  double p;
  unsigned long long seed;
  std::size_t N;
  try {
    p    = std::stod(argv[1]);
    seed = std::stoull(argv[2]);
    N    = static_cast<std::size_t>(std::stoull(argv[3]));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  if (p < 0.0 || p > 1.0) {
    std::cerr << "Error: p must lie in [0,1]\n";
    return 1;
  }

  rb::core::UniformRng rng(seed);

  // Indicatrice de gain : moyenne = fréquence empirique
  rb::core::RunningStats acc;
  for (std::size_t i = 0; i < N; ++i) {
    acc.add(rb::game::coin_flip_win(p, rng) ? 1.0 : 0.0);
  }

  const double freq  = acc.mean();
  const double se_th = std::sqrt(p * (1.0 - p) / static_cast<double>(N ? N : 1));
  const double z     = (se_th > 0.0) ? (freq - p) / se_th : 0.0;

  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);
  std::cout << "freq_emp=" << freq << " p=" << p
            << " se_th=" << se_th << " z=" << z << "\n";
  return 0;
}
