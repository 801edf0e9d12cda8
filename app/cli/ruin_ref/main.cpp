#include <rb/analytic/closed_form.hpp>
#include <rb/game/bet_params.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <cstdlib>

struct Case {
  double w0, bet, target, p;
};

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [W0 bet target p]\n"
            << "If no arguments are provided, runs 4 reference cases.\n";
}

int main(int argc, char** argv) {
  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);

  std::vector<Case> cases;
  if (argc == 1) {
    cases.push_back({20.0, 1.0, 40.0, 0.50});  // jeu équitable
    cases.push_back({20.0, 1.0, 40.0, 0.49});  // léger avantage maison
    cases.push_back({10.0, 2.0, 50.0, 0.45});
    cases.push_back({ 5.0, 1.0, 10.0, 0.60});
  } else if (argc == 5) {
    Case c;
    try {
      c.w0     = std::stod(argv[1]);
      c.bet    = std::stod(argv[2]);
      c.target = std::stod(argv[3]);
      c.p      = std::stod(argv[4]);
    } catch (const std::exception&) {
      print_usage(argv[0]);
      return 1;
    }
    cases.push_back(c);
  } else {
    print_usage(argv[0]);
    return 1;
  }

  std::cout << "     W0      bet   target        p    P(ruin)   E[wealth]      E[steps]\n";
  std::cout << "-----------------------------------------------------------------------\n";
  try {
    for (const auto& c : cases) {
      const rb::game::BetParams params(c.w0, c.bet, c.target, c.p, 1.0);
      const auto cf = rb::analytic::closed_form(params);

      std::cout << std::setw(7)  << c.w0     << ' '
                << std::setw(8)  << c.bet    << ' '
                << std::setw(8)  << c.target << ' '
                << std::setw(8)  << c.p      << ' '
                << std::setw(10) << cf.ruin_probability << ' '
                << std::setw(11) << cf.expected_wealth  << ' '
                << std::setw(13) << cf.expected_steps   << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
