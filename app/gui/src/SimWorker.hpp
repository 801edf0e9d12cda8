#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <atomic>
#include <cstddef>

// RB types (on passe par valeur ⇒ on inclut ici)
#include <rb/game/bet_params.hpp>
#include <rb/config/sim_config.hpp>

namespace gui {

class SimWorker : public QObject {
  Q_OBJECT
public:
  explicit SimWorker(QObject* parent = nullptr);
  ~SimWorker() override = default;

public slots:
  // Run Monte Carlo complet, progress() après chaque lot.
  void runSimulation(rb::game::BetParams params, rb::config::SimConfig cfg);

  // Demande d’arrêt asynchrone (atomique : appelable depuis le thread GUI)
  void requestStop();

signals:
  void progress(std::size_t nDone, double expectedWealth, double halfwidth95,
                double expectedSteps);
  void finished(double expectedWealth, double wealthSe,
                double ciLow, double ciHigh,
                double expectedSteps, double ruinProb,
                std::size_t nTrials, long long elapsedMs);
  void pathReady(const QVector<double>& path);
  void failed(QString why);
  void canceled();

private:
  std::atomic<bool> stop_{false};
};

} // namespace gui
