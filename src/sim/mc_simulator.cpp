#include <rb/sim/mc_simulator.hpp>
#include <rb/sim/workers.hpp>

#include <algorithm>  // std::min, std::max
#include <chrono>     // steady_clock, duration_cast
#include <stdexcept>  // std::invalid_argument

namespace rb {
namespace sim {

namespace {

// Accumulateurs partiels d’un worker sur un lot.
struct Partial {
  rb::core::RunningStats wealth;
  rb::core::RunningStats steps;
  std::size_t busted{0};
  std::size_t target{0};
  std::size_t truncated{0};

  void merge(const Partial& o) noexcept {
    wealth.merge(o.wealth);
    steps.merge(o.steps);
    busted    += o.busted;
    target    += o.target;
    truncated += o.truncated;
  }
};

// Joue `count` parties ; la dernière remplit `path` si non nul.
void play_trials(const rb::models::RandomWalk& walk,
                 rb::core::UniformSource& rng,
                 std::size_t count,
                 std::size_t max_steps,
                 Partial& out,
                 std::vector<double>* path) {
  using rb::models::WalkState;
  for (std::size_t i = 0; i < count; ++i) {
    std::vector<double>* p = (i + 1 == count) ? path : nullptr;
    const auto tr = walk.run_trial(rng, max_steps, p);

    out.wealth.add(tr.final_wealth);
    out.steps.add(static_cast<double>(tr.steps));
    switch (tr.state) {
      case WalkState::Busted:        ++out.busted;    break;
      case WalkState::TargetReached: ++out.target;    break;
      case WalkState::Active:        ++out.truncated; break;
    }
  }
}

} // anonymous

McSimulator::McSimulator(rb::config::SimConfig cfg) : cfg_(cfg) {
  if (cfg_.n_trials == 0) {
    throw std::invalid_argument("McSimulator: n_trials must be >= 1");
  }
  if (cfg_.batch_size == 0) {
    throw std::invalid_argument("McSimulator: batch_size must be >= 1");
  }
  if (cfg_.n_threads == 0) {
    throw std::invalid_argument("McSimulator: n_threads must be >= 1");
  }
}

SimulationResult McSimulator::run(const rb::game::BetParams& params) const {
  std::vector<rb::core::UniformRng> rngs;
  rngs.reserve(cfg_.n_threads);
  for (std::size_t k = 0; k < cfg_.n_threads; ++k) {
    rngs.emplace_back(rb::core::derive_seed(cfg_.seed, k));
  }

  std::vector<rb::core::UniformSource*> streams;
  streams.reserve(rngs.size());
  for (auto& r : rngs) streams.push_back(&r);

  return run_streams_(params, streams);
}

SimulationResult McSimulator::run(const rb::game::BetParams& params,
                                  rb::core::UniformSource& rng) const {
  return run_streams_(params, std::vector<rb::core::UniformSource*>{ &rng });
}

SimulationResult McSimulator::run_streams_(
    const rb::game::BetParams& params,
    const std::vector<rb::core::UniformSource*>& streams) const {
  using clock = std::chrono::steady_clock;
  const auto t0 = clock::now();

  const rb::models::RandomWalk walk(params);

  Partial total;
  SimulationResult res{};
  std::vector<ConvergencePoint> log;
  if (log_enabled_) {
    log.reserve((cfg_.n_trials + cfg_.batch_size - 1) / cfg_.batch_size);
  }
  std::vector<double>* path = cfg_.record_last_path ? &res.last_path : nullptr;

  std::size_t done = 0;
  while (done < cfg_.n_trials) {
    const std::size_t batchN  = std::min(cfg_.batch_size, cfg_.n_trials - done);
    const std::size_t workers = std::min(streams.size(), batchN);

    std::vector<Partial> partials(workers);

    if (workers == 1) {
      play_trials(walk, *streams[0], batchN, cfg_.max_steps, partials[0], path);
    } else {
      // Répartition : batchN/workers chacun, le reste sur les premiers workers.
      const std::size_t base = batchN / workers;
      const std::size_t rem  = batchN % workers;

      run_workers(workers, [&](std::size_t k) {
        const std::size_t share = base + (k < rem ? 1 : 0);
        std::vector<double>* wpath = (k + 1 == workers) ? path : nullptr;
        play_trials(walk, *streams[k], share, cfg_.max_steps, partials[k], wpath);
      });
    }

    for (const auto& pt : partials) total.merge(pt);
    done += batchN;

    const double se = total.wealth.std_error();
    const ConvergencePoint point{ done, total.wealth.mean(),
                                  rb::core::half_width_95(se),
                                  total.steps.mean() };
    if (log_enabled_) log.push_back(point);

    if (observer_ && !observer_(point)) {
      res.stopped_early = true;
      break;
    }
    if (cfg_.tolerance > 0.0 && se < cfg_.tolerance) break;
  }

  const auto t1 = clock::now();

  const std::size_t n = total.wealth.count();
  const auto ci = rb::core::confidence_interval_95(total.wealth.mean(),
                                                   total.wealth.std_error());

  res.expected_wealth    = total.wealth.mean();
  res.wealth_std_error   = total.wealth.std_error();
  res.wealth_ci_low      = ci.low;
  res.wealth_ci_high     = ci.high;
  res.expected_steps     = total.steps.mean();
  res.steps_std_error    = total.steps.std_error();
  res.max_steps_seen     = static_cast<std::size_t>(total.steps.max());
  res.n_trials           = n;
  res.n_busted           = total.busted;
  res.n_target           = total.target;
  res.n_truncated        = total.truncated;
  res.ruin_probability   = static_cast<double>(total.busted) / static_cast<double>(n);
  res.target_probability = static_cast<double>(total.target) / static_cast<double>(n);
  res.elapsed_ms         = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
  if (log_enabled_) res.convergence_log = std::move(log);
  return res;
}

SimulationResult monte_carlo_average(const rb::game::BetParams& params,
                                     std::size_t n_trials,
                                     rb::core::UniformSource& rng) {
  const McSimulator sim(rb::config::SimConfig(n_trials, n_trials));
  return sim.run(params, rng);
}

} // namespace sim
} // namespace rb
