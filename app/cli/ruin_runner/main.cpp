#include <rb/game/bet_params.hpp>
#include <rb/config/sim_config.hpp>
#include <rb/sim/mc_simulator.hpp>
#include <rb/analytic/closed_form.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cstdlib>

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " W0 bet target p takehome seed n_trials batch tol"
            << " [--threads N] [--max-steps N] [--log] [--path] [--closed-form]\n";
}

int main(int argc, char** argv) {
  if (argc < 10) {
    print_usage(argv[0]);
    return 1;
  }

  // Parse positionnels
  double w0, bet, target, p, takehome, tol;
  unsigned long long seed;
  std::size_t n_trials, batch;

  try {
    w0       = std::stod(argv[1]);
    bet      = std::stod(argv[2]);
    target   = std::stod(argv[3]);
    p        = std::stod(argv[4]);
    takehome = std::stod(argv[5]);
    seed     = std::stoull(argv[6]);
    n_trials = static_cast<std::size_t>(std::stoull(argv[7]));
    batch    = static_cast<std::size_t>(std::stoull(argv[8]));
    tol      = std::stod(argv[9]);
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  // Flags optionnels
  std::size_t n_threads = 1;
  std::size_t max_steps = 0;
  bool want_log = false;
  bool want_path = false;
  bool want_closed_form = false;

  try {
    for (int i = 10; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--threads" && i + 1 < argc) {
        n_threads = static_cast<std::size_t>(std::stoull(argv[++i]));
      } else if (arg == "--max-steps" && i + 1 < argc) {
        max_steps = static_cast<std::size_t>(std::stoull(argv[++i]));
      } else if (arg == "--log") {
        want_log = true;
      } else if (arg == "--path") {
        want_path = true;
      } else if (arg == "--closed-form") {
        want_closed_form = true;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    rb::game::BetParams params(w0, bet, target, p, takehome);

    rb::config::SimConfig cfg(n_trials, batch, tol, seed, n_threads, max_steps, want_path);
    rb::sim::McSimulator sim(cfg);
    if (want_log) sim.enable_convergence_log(true);

    const auto res = sim.run(params);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);

    std::cout << "expected_wealth : " << res.expected_wealth    << "\n"
              << "wealth_se       : " << res.wealth_std_error   << "\n"
              << "wealth_ci_low   : " << res.wealth_ci_low      << "\n"
              << "wealth_ci_high  : " << res.wealth_ci_high     << "\n"
              << "expected_steps  : " << res.expected_steps     << "\n"
              << "steps_se        : " << res.steps_std_error    << "\n"
              << "max_steps_seen  : " << res.max_steps_seen     << "\n"
              << "ruin_prob       : " << res.ruin_probability   << "\n"
              << "target_prob     : " << res.target_probability << "\n"
              << "n_trials        : " << res.n_trials           << "\n"
              << "n_busted        : " << res.n_busted           << "\n"
              << "n_target        : " << res.n_target           << "\n"
              << "n_truncated     : " << res.n_truncated        << "\n"
              << "threads         : " << n_threads              << "\n"
              << "elapsed_ms      : " << res.elapsed_ms         << "\n";

    if (want_closed_form) {
      if (rb::analytic::closed_form_applies(params)) {
        const auto cf = rb::analytic::closed_form(params);
        std::cout << "cf_wealth       : " << cf.expected_wealth    << "\n"
                  << "cf_steps        : " << cf.expected_steps     << "\n"
                  << "cf_ruin_prob    : " << cf.ruin_probability   << "\n";
      } else {
        std::cout << "closed form     : n/a (needs takehome=1 and W0, target multiples of bet)\n";
      }
    }

    if (want_log) {
      std::cout << "\nn_cum,expected_wealth,half_width_95,expected_steps\n";
      for (const auto& pt : res.convergence_log) {
        std::cout << pt.n_cum << ',' << pt.expected_wealth << ','
                  << pt.half_width_95 << ',' << pt.expected_steps << '\n';
      }
    }

    if (want_path) {
      std::cout << "\nlast_path (" << res.last_path.size() << " points):";
      for (double w : res.last_path) std::cout << ' ' << w;
      std::cout << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }

  return 0;
}
