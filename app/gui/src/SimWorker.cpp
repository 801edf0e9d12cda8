#include "SimWorker.hpp"

#include <rb/sim/mc_simulator.hpp>

#include <QDebug>
#include <QString>

namespace gui {

SimWorker::SimWorker(QObject* parent) : QObject(parent) {}

void SimWorker::requestStop() { stop_.store(true, std::memory_order_relaxed); }

void SimWorker::runSimulation(rb::game::BetParams params, rb::config::SimConfig cfg)
{
  stop_.store(false, std::memory_order_relaxed);

  try {
    qDebug() << "[runSimulation]"
             << "W0=" << params.initial_wealth << "bet=" << params.bet
             << "target=" << params.target << "p=" << params.p
             << "takehome=" << params.takehome;
    qDebug() << "[runSimulation]"
             << "n_trials=" << static_cast<qulonglong>(cfg.n_trials)
             << "batch=" << static_cast<qulonglong>(cfg.batch_size)
             << "tol=" << cfg.tolerance
             << "seed=" << static_cast<qulonglong>(cfg.seed)
             << "threads=" << static_cast<qulonglong>(cfg.n_threads)
             << "max_steps=" << static_cast<qulonglong>(cfg.max_steps);

    rb::sim::McSimulator sim(cfg);

    // Progress live + arrêt coopératif en fin de lot
    sim.set_batch_observer([this](const rb::sim::ConvergencePoint& pt) {
      emit progress(pt.n_cum, pt.expected_wealth, pt.half_width_95, pt.expected_steps);
      return !stop_.load(std::memory_order_relaxed);
    });

    const auto res = sim.run(params);

    qDebug() << "[runSimulation]" << "done n=" << static_cast<qulonglong>(res.n_trials)
             << "E[W]=" << res.expected_wealth << "E[T]=" << res.expected_steps
             << "ms=" << res.elapsed_ms << "stoppedEarly=" << res.stopped_early;

    if (res.stopped_early) {
      emit canceled();
      return;
    }

    if (cfg.record_last_path) {
      QVector<double> path;
      path.reserve(static_cast<int>(res.last_path.size()));
      for (double w : res.last_path) path.push_back(w);
      emit pathReady(path);
    }

    emit finished(res.expected_wealth, res.wealth_std_error,
                  res.wealth_ci_low, res.wealth_ci_high,
                  res.expected_steps, res.ruin_probability,
                  res.n_trials, res.elapsed_ms);
  } catch (const std::exception& e) {
    qDebug() << "[runSimulation]" << "failed:" << e.what();
    emit failed(QString::fromUtf8(e.what()));
  }
}

} // namespace gui
