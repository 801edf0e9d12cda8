#pragma once
#include <QMainWindow>
#include <QThread>
#include <QVector>
#include <cstddef>

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

namespace gui { class SimWorker; }

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onRun();
  void onStop();
  void onLoadDefaults();

  // Callbacks worker
  void onSimProgress(std::size_t n, double expectedWealth, double half,
                     double expectedSteps);
  void onSimFinished(double expectedWealth, double se,
                     double ciLow, double ciHigh,
                     double expectedSteps, double ruinProb,
                     std::size_t nTrials, long long ms);
  void onSimPath(const QVector<double>& path);
  void onSimFailed(const QString& why);
  void onSimCanceled();

private:
  Ui::MainWindow* ui;

  // Worker thread pour le Monte Carlo
  QThread* simThread_ {nullptr};
  gui::SimWorker* simWorker_ {nullptr};
  std::size_t nTarget_ {0};

  void wireSignals();
  void startSimWorker();
  void stopSimWorker();
  void setRunning(bool running);
  void setResults(double expectedWealth, double se, double ciLow, double ciHigh,
                  double expectedSteps, double ruinProb,
                  std::size_t nTrials, long long ms);
  void logLine(const QString& line);
};
