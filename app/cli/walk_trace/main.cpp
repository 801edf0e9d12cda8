#include <rb/game/bet_params.hpp>
#include <rb/models/random_walk.hpp>
#include <rb/core/uniform_rng.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cstdlib>

// Une seule partie : trajectoire complète, une richesse par ligne (step,wealth).
int main(int argc, char** argv) {
  if (argc < 7 || argc > 8) {
    std::cerr << "Usage: " << argv[0] << " W0 bet target p takehome seed [max_steps]\n";
    return 1;
  }

  try {
    const double w0       = std::stod(argv[1]);
    const double bet      = std::stod(argv[2]);
    const double target   = std::stod(argv[3]);
    const double p        = std::stod(argv[4]);
    const double takehome = std::stod(argv[5]);
    const unsigned long long seed = std::stoull(argv[6]);
    const std::size_t max_steps = (argc == 8)
        ? static_cast<std::size_t>(std::stoull(argv[7])) : 0;

    rb::models::RandomWalk walk(rb::game::BetParams(w0, bet, target, p, takehome));
    rb::core::UniformRng rng(seed);

    std::vector<double> path;
    const auto tr = walk.run_trial(rng, max_steps, &path);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "step,wealth\n";
    for (std::size_t k = 0; k < path.size(); ++k) {
      std::cout << k << ',' << path[k] << '\n';
    }
    std::cerr << "steps=" << tr.steps
              << " final_wealth=" << tr.final_wealth
              << " state=" << rb::models::to_string(tr.state) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
