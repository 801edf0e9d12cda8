#include "MainWindow.hpp"
#include "ui_MainWindow.h"
#include "SimWorker.hpp"

#include <rb/game/bet_params.hpp>
#include <rb/config/sim_config.hpp>
#include <rb/analytic/closed_form.hpp>

#include <QDebug>
#include <QMessageBox>
#include <QMetaObject>
#include <QPushButton>
#include <QStatusBar>

#include <cmath>
#include <cstdint>
#include <stdexcept>

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent), ui(new Ui::MainWindow) {
  ui->setupUi(this);
  // Enregistrements pour les queued connections
  qRegisterMetaType<std::size_t>("std::size_t");
  qRegisterMetaType<QVector<double>>("QVector<double>");
  wireSignals();
  onLoadDefaults();
}

MainWindow::~MainWindow() {
  stopSimWorker();
  delete ui;
}

void MainWindow::wireSignals() {
  connect(ui->btnRun,      &QPushButton::clicked, this, &MainWindow::onRun);
  connect(ui->btnStop,     &QPushButton::clicked, this, &MainWindow::onStop);
  connect(ui->btnDefaults, &QPushButton::clicked, this, &MainWindow::onLoadDefaults);
}

void MainWindow::startSimWorker() {
  // Évite d’empiler des threads si déjà lancé
  if (simThread_ && simWorker_) return;

  simThread_ = new QThread(this);
  simWorker_ = new gui::SimWorker();             // PAS de parent → il vivra dans simThread_
  simWorker_->moveToThread(simThread_);

  connect(simThread_, &QThread::finished, simWorker_, &QObject::deleteLater);

  // Worker -> GUI : Qt::QueuedConnection (inter-threads)
  connect(simWorker_, &gui::SimWorker::progress,  this, &MainWindow::onSimProgress, Qt::QueuedConnection);
  connect(simWorker_, &gui::SimWorker::finished,  this, &MainWindow::onSimFinished, Qt::QueuedConnection);
  connect(simWorker_, &gui::SimWorker::pathReady, this, &MainWindow::onSimPath,     Qt::QueuedConnection);
  connect(simWorker_, &gui::SimWorker::failed,    this, &MainWindow::onSimFailed,   Qt::QueuedConnection);
  connect(simWorker_, &gui::SimWorker::canceled,  this, &MainWindow::onSimCanceled, Qt::QueuedConnection);

  simThread_->start();
  qDebug() << "[UI] worker thread started";
}

void MainWindow::stopSimWorker() {
  if (!simThread_) return;

  if (simWorker_) {
    QObject::disconnect(simWorker_, nullptr, this, nullptr);
    // Le worker est occupé dans runSimulation : on passe par le flag atomique,
    // pas par la file d’événements.
    simWorker_->requestStop();
  }

  simThread_->quit();
  simThread_->wait();

  // deleteLater(worker) est déjà connecté sur finished du thread
  simThread_->deleteLater();
  simThread_ = nullptr;
  simWorker_ = nullptr;
  qDebug() << "[UI] worker thread stopped";
}

void MainWindow::setRunning(bool running) {
  ui->btnRun->setEnabled(!running);
  ui->btnDefaults->setEnabled(!running);
  ui->btnStop->setEnabled(running);
  if (running) setCursor(Qt::BusyCursor);
  else unsetCursor();
}

void MainWindow::logLine(const QString& line) {
  ui->txtLog->appendPlainText(line);
}

void MainWindow::onLoadDefaults() {
  const rb::config::SimConfig def;
  ui->sbW0->setValue(20.0);
  ui->sbBet->setValue(1.0);
  ui->sbTarget->setValue(40.0);
  ui->sbP->setValue(0.5);
  ui->sbTakehome->setValue(1.0);

  ui->sbTrials->setValue(static_cast<int>(def.n_trials));
  ui->sbBatch->setValue(static_cast<int>(def.batch_size));
  ui->dsbTol->setValue(def.tolerance);
  ui->sbSeed->setValue(static_cast<int>(def.seed));
  ui->sbThreads->setValue(static_cast<int>(def.n_threads));
  ui->sbMaxSteps->setValue(static_cast<int>(def.max_steps));
  ui->chkRecordPath->setChecked(def.record_last_path);

  setResults(std::nan(""), std::nan(""), std::nan(""), std::nan(""),
             std::nan(""), std::nan(""), 0, 0);
  ui->lblClosedForm->setText("-");
  ui->progressBar->setValue(0);
}

void MainWindow::onRun() {
  // Lire inputs (partie)
  const double w0       = ui->sbW0->value();
  const double bet      = ui->sbBet->value();
  const double target   = ui->sbTarget->value();
  const double p        = ui->sbP->value();
  const double takehome = ui->sbTakehome->value();

  // Config Monte Carlo
  const std::size_t nTrials  = static_cast<std::size_t>(ui->sbTrials->value());
  const std::size_t batch    = static_cast<std::size_t>(ui->sbBatch->value());
  const double      tol      = ui->dsbTol->value();
  const std::uint64_t seed   = static_cast<std::uint64_t>(ui->sbSeed->value());
  const std::size_t threads  = static_cast<std::size_t>(ui->sbThreads->value());
  const std::size_t maxSteps = static_cast<std::size_t>(ui->sbMaxSteps->value());
  const bool keepPath        = ui->chkRecordPath->isChecked();

  qDebug() << "[UI] onRun W0=" << w0 << "bet=" << bet << "target=" << target
           << "p=" << p << "takehome=" << takehome;

  try {
    rb::game::BetParams params(w0, bet, target, p, takehome);
    rb::config::SimConfig cfg(nTrials, batch, tol, seed, threads, maxSteps, keepPath);

    // Référence exacte quand elle existe
    if (rb::analytic::closed_form_applies(params)) {
      const auto cf = rb::analytic::closed_form(params);
      ui->lblClosedForm->setText(QString::asprintf("E[W]=%.6f  E[T]=%.3f  P(ruin)=%.6f",
                                                   cf.expected_wealth, cf.expected_steps,
                                                   cf.ruin_probability));
    } else {
      ui->lblClosedForm->setText("n/a");
    }

    nTarget_ = nTrials;
    ui->progressBar->setValue(0);
    ui->txtLog->clear();
    logLine("n_cum, E[W], half_width_95, E[T]");
    setResults(std::nan(""), std::nan(""), std::nan(""), std::nan(""),
               std::nan(""), std::nan(""), 0, 0);
    setRunning(true);

    startSimWorker();
    QMetaObject::invokeMethod(
      simWorker_,
      [w=simWorker_, params, cfg]() { w->runSimulation(params, cfg); },
      Qt::QueuedConnection
    );
  } catch (const std::invalid_argument& e) {
    QMessageBox::warning(this, "Invalid parameters", QString::fromUtf8(e.what()));
  }
}

void MainWindow::onStop() {
  if (simWorker_) simWorker_->requestStop();
  statusBar()->showMessage("Stopping at end of batch...", 1500);
}

void MainWindow::setResults(double expectedWealth, double se, double ciLow, double ciHigh,
                            double expectedSteps, double ruinProb,
                            std::size_t nTrials, long long ms) {
  ui->lblExpWealth->setText(std::isnan(expectedWealth) ? "-" : QString::asprintf("%.6f", expectedWealth));
  ui->lblSE      ->setText(std::isnan(se)    ? "-" : QString::asprintf("%.6f", se));
  ui->lblCI      ->setText(std::isnan(ciLow) || std::isnan(ciHigh)
                             ? "-" : QString::asprintf("[%.6f, %.6f]", ciLow, ciHigh));
  ui->lblExpSteps->setText(std::isnan(expectedSteps) ? "-" : QString::asprintf("%.3f", expectedSteps));
  ui->lblRuin    ->setText(std::isnan(ruinProb) ? "-" : QString::asprintf("%.6f", ruinProb));
  ui->lblNTrials ->setText(nTrials ? QString::number(nTrials) : "-");
  ui->lblElapsed ->setText(ms ? QString::number(ms) : "-");
}

void MainWindow::onSimProgress(std::size_t n, double expectedWealth, double half,
                               double expectedSteps) {
  if (nTarget_ > 0) {
    ui->progressBar->setValue(static_cast<int>((100.0 * static_cast<double>(n)) /
                                               static_cast<double>(nTarget_)));
  }
  logLine(QString::asprintf("%zu, %.6f, %.6f, %.3f", n, expectedWealth, half, expectedSteps));
}

void MainWindow::onSimFinished(double expectedWealth, double se,
                               double ciLow, double ciHigh,
                               double expectedSteps, double ruinProb,
                               std::size_t nTrials, long long ms) {
  setResults(expectedWealth, se, ciLow, ciHigh, expectedSteps, ruinProb, nTrials, ms);
  ui->progressBar->setValue(100);
  setRunning(false);
  stopSimWorker();
}

void MainWindow::onSimPath(const QVector<double>& path) {
  // Trajectoire de la dernière partie, tronquée à l’affichage
  constexpr int kShown = 60;
  QString line = QString("last trajectory (%1 points):").arg(path.size());
  for (int k = 0; k < path.size() && k < kShown; ++k) {
    line += QString(" %1").arg(path[k], 0, 'g', 6);
  }
  if (path.size() > kShown) {
    line += QString(" ... %1").arg(path.back(), 0, 'g', 6);
  }
  logLine(line);
}

void MainWindow::onSimFailed(const QString& why) {
  QMessageBox::warning(this, "Simulation failed", why);
  setRunning(false);
  stopSimWorker();
}

void MainWindow::onSimCanceled() {
  statusBar()->showMessage("Run canceled.", 2000);
  setRunning(false);
  stopSimWorker();
}
