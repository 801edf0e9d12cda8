#include <rb/sim/mc_simulator.hpp>
#include <rb/analytic/closed_form.hpp>
#include <rb/config/sim_config.hpp>
#include <rb/game/bet_params.hpp>
#include <rb/core/uniform_rng.hpp>
#include <rb/sim/workers.hpp>

#include <atomic>
#include <cmath>
#include <functional>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using rb::config::SimConfig;
using rb::game::BetParams;
using rb::sim::McSimulator;
using rb::sim::SimulationResult;

static bool same_result(const SimulationResult& a, const SimulationResult& b) {
  return a.expected_wealth == b.expected_wealth &&
         a.expected_steps  == b.expected_steps &&
         a.n_trials == b.n_trials &&
         a.n_busted == b.n_busted &&
         a.n_target == b.n_target;
}

static void test_fair_game_martingale() {
  // Jeu équitable : E[richesse finale] = richesse initiale, E[coups] = i (N - i)
  const BetParams params(20, 1, 40, 0.5, 1.0);
  McSimulator sim(SimConfig(/*n_trials=*/20000, /*batch=*/5000, /*tol=*/-1.0, /*seed=*/42));
  const auto res = sim.run(params);

  assert(res.n_trials == 20000);
  assert(res.n_busted + res.n_target == res.n_trials);
  assert(res.n_truncated == 0);
  assert(std::abs(res.expected_wealth - 20.0) < 1.0);
  assert(std::abs(res.expected_steps - 400.0) < 15.0);
  assert(res.wealth_ci_low < res.expected_wealth && res.expected_wealth < res.wealth_ci_high);
  assert(std::abs(res.ruin_probability - 0.5) < 0.025);
  assert(std::abs(res.ruin_probability + res.target_probability - 1.0) < 1e-12);
}

static void test_against_closed_form() {
  // Avantage maison (p = 0.45) : comparaison à la formule fermée
  const BetParams params(10, 1, 20, 0.45, 1.0);
  const auto cf = rb::analytic::closed_form(params);

  McSimulator sim(SimConfig(20000, 2000, -1.0, 7));
  const auto res = sim.run(params);

  assert(std::abs(res.expected_wealth - cf.expected_wealth) < 5.0 * res.wealth_std_error);
  assert(std::abs(res.expected_steps  - cf.expected_steps)  < 5.0 * res.steps_std_error);
  assert(std::abs(res.ruin_probability - cf.ruin_probability) < 0.02);
}

static void test_degenerate_probabilities() {
  McSimulator sim(SimConfig(500, 100));

  const auto lose = sim.run(BetParams(20, 1, 40, 0.0, 1.0));
  assert(lose.expected_wealth == 0.0);
  assert(lose.expected_steps == 20.0);
  assert(lose.ruin_probability == 1.0);
  assert(lose.wealth_std_error == 0.0);

  const auto win = sim.run(BetParams(20, 1, 40, 1.0, 1.0));
  assert(win.expected_wealth == 40.0);
  assert(win.expected_steps == 20.0);
  assert(win.target_probability == 1.0);

  // Départ sur une borne : 0 coup
  const auto at_target = sim.run(BetParams(40, 1, 40, 0.5, 1.0));
  assert(at_target.expected_steps == 0.0 && at_target.expected_wealth == 40.0);
  const auto at_zero = sim.run(BetParams(0, 1, 40, 0.5, 1.0));
  assert(at_zero.expected_steps == 0.0 && at_zero.expected_wealth == 0.0);
}

static void test_reproducibility_and_threads() {
  const BetParams params(10, 1, 30, 0.48, 1.0);

  // Séquentiel : même graine ⇒ même résultat ; identique à un run sur source injectée
  McSimulator seq(SimConfig(3000, 500, -1.0, 99));
  const auto a = seq.run(params);
  const auto b = seq.run(params);
  assert(same_result(a, b));

  rb::core::UniformRng injected(99);
  const auto c = seq.run(params, injected);
  assert(same_result(a, c));

  // Parallèle : déterministe pour (seed, n_threads, batch)
  McSimulator par(SimConfig(3000, 500, -1.0, 99, /*threads=*/4));
  const auto p1 = par.run(params);
  const auto p2 = par.run(params);
  assert(same_result(p1, p2));
  assert(p1.n_trials == 3000);
  assert(p1.n_busted + p1.n_target == 3000);

  // Séquentiel et parallèle estiment la même quantité
  const double tol = 5.0 * std::sqrt(a.wealth_std_error * a.wealth_std_error +
                                     p1.wealth_std_error * p1.wealth_std_error);
  assert(std::abs(a.expected_wealth - p1.expected_wealth) < tol);

  // Lot plus petit que le nombre de threads : un seul worker par partie
  McSimulator tiny(SimConfig(7, 3, -1.0, 5, /*threads=*/8));
  const auto t = tiny.run(params);
  assert(t.n_trials == 7);
}

static void test_convergence_and_stopping() {
  const BetParams params(20, 1, 40, 0.5, 1.0);

  // Journal : un point par lot, n_cum croissant jusqu’à n_trials
  McSimulator logged(SimConfig(1000, 250));
  logged.enable_convergence_log(true);
  const auto r = logged.run(params);
  assert(r.convergence_log.size() == 4);
  assert(r.convergence_log.front().n_cum == 250);
  assert(r.convergence_log.back().n_cum == 1000);
  assert(r.convergence_log.back().expected_wealth == r.expected_wealth);
  assert(r.convergence_log.back().expected_steps == r.expected_steps);

  // Arrêt sur tolérance
  McSimulator early(SimConfig(1000000, 200, /*tol=*/0.5, 3));
  const auto e = early.run(params);
  assert(e.n_trials < 1000000);
  assert(e.n_trials % 200 == 0);
  assert(e.wealth_std_error < 0.5);
  assert(!e.stopped_early);

  // Interruption par l’observateur après 3 lots
  McSimulator observed(SimConfig(10000, 100));
  observed.enable_convergence_log(true);
  std::size_t calls = 0;
  observed.set_batch_observer([&calls](const rb::sim::ConvergencePoint& pt) {
    ++calls;
    assert(pt.n_cum == calls * 100);
    return calls < 3;
  });
  const auto o = observed.run(params);
  assert(o.stopped_early);
  assert(o.n_trials == 300);
  assert(o.convergence_log.size() == 3);
}

static void test_step_cap_and_path() {
  // Plafond de 10 coups depuis 20 : aucune partie ne peut finir
  McSimulator capped(SimConfig(200, 50, -1.0, 11, 1, /*max_steps=*/10));
  const auto c = capped.run(BetParams(20, 1, 40, 0.5, 1.0));
  assert(c.n_truncated == 200);
  assert(c.expected_steps == 10.0);
  assert(c.max_steps_seen == 10);

  // Trajectoire de la dernière partie
  McSimulator traced(SimConfig(50, 20, -1.0, 13, 2, 0, /*record_last_path=*/true));
  const auto t = traced.run(BetParams(5, 1, 10, 0.5, 1.0));
  assert(!t.last_path.empty());
  assert(t.last_path.front() == 5.0);
  assert(t.last_path.back() == 0.0 || t.last_path.back() == 10.0);
  for (double w : t.last_path) assert(w >= 0.0 && w <= 10.0);

  McSimulator untraced(SimConfig(50, 20));
  assert(untraced.run(BetParams(5, 1, 10)).last_path.empty());
}

static void test_scripted_average() {
  // Source constante 0.1 et p = 0.5 : toutes les parties gagnent
  rb::core::SequenceRng wins({0.1}, /*cycle=*/true);
  const auto r = rb::sim::monte_carlo_average(BetParams(20, 1, 40, 0.5, 1.0), 100, wins);
  assert(r.n_trials == 100);
  assert(r.expected_wealth == 40.0);
  assert(r.expected_steps == 20.0);
  assert(wins.consumed() == 2000);

  // Source scriptée épuisée : l’erreur remonte
  rb::core::SequenceRng short_seq({0.1, 0.2});
  bool threw = false;
  try {
    rb::sim::monte_carlo_average(BetParams(20, 1, 40, 0.5, 1.0), 1, short_seq);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

static void test_invalid_config() {
  bool threw = false;
  try { McSimulator s(SimConfig(0)); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  threw = false;
  try { McSimulator s(SimConfig(10, 0)); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  threw = false;
  try { McSimulator s(SimConfig(10, 10, -1.0, 42, 0)); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  threw = false;
  rb::core::UniformRng rng(1);
  try { rb::sim::monte_carlo_average(BetParams(5, 1, 10), 0, rng); }
  catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
}

static void test_workers_join_on_failure() {
  // Cas nominal : chaque worker passe une fois
  std::vector<int> seen(6, 0);
  rb::sim::run_workers(6, [&seen](std::size_t k) { ++seen[k]; });
  for (int v : seen) assert(v == 1);

  // Exception dans une tâche : relancée après le join de tous les workers
  std::atomic<int> finished{0};
  bool threw = false;
  try {
    rb::sim::run_workers(4, [&finished](std::size_t k) {
      if (k == 1) throw std::runtime_error("worker 1");
      ++finished;
    });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(finished == 3);

  // Création du 3e thread impossible : les deux premiers sont joints, l’erreur remonte
  std::atomic<int> ran{0};
  std::size_t spawned = 0;
  const rb::sim::ThreadSpawner failing = [&spawned](std::function<void()> f) {
    if (spawned == 2) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                              "thread creation");
    }
    ++spawned;
    return std::thread(std::move(f));
  };
  threw = false;
  try {
    rb::sim::run_workers(5, [&ran](std::size_t) { ++ran; }, failing);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(ran == 2);
}

int main() {
  test_fair_game_martingale();
  test_against_closed_form();
  test_degenerate_probabilities();
  test_reproducibility_and_threads();
  test_convergence_and_stopping();
  test_step_cap_and_path();
  test_scripted_average();
  test_invalid_config();
  test_workers_join_on_failure();
  std::cout << "Monte Carlo simulator OK.\n";
  return 0;
}
