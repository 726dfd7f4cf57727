#include "MainWindow.hpp"

#include <QCheckBox>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileDialog>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLabel>
#include <QMessageBox>
#include <QMetaObject>
#include <QMetaType>
#include <QPainter>
#include <QProgressBar>
#include <QPushButton>
#include <QSpinBox>
#include <QStatusBar>
#include <QVBoxLayout>

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <exception>

#include "HistogramChart.hpp"
#include "SimWorker.hpp"

#include <pc/core/outcome.hpp>
#include <pc/core/theory.hpp>
#include <pc/io/histogram_csv.hpp>

using namespace QtCharts;

namespace {
// Longueur max relue sans coupure (P(L > 200) ~ 1e-11 pour 8 lots)
constexpr std::size_t kMaxUncutLength = 200;
} // namespace

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent) {
  // Enregistrements pour les queued connections
  qRegisterMetaType<std::size_t>("std::size_t");
  qRegisterMetaType<pc::config::SimConfig>("pc::config::SimConfig");
  qRegisterMetaType<pc::sim::BatchSummary>("pc::sim::BatchSummary");

  buildUi();
  wireSignals();
  clearResults();
  setRunning(false);
  statusBar()->showMessage(tr("Ready"));
}

MainWindow::~MainWindow() {
  stopSimWorker();
}

void MainWindow::buildUi() {
  setWindowTitle("Prize collector");
  auto* central = new QWidget(this);
  auto* root = new QHBoxLayout(central);

  // ---- colonne de gauche : paramètres + résultats ----
  auto* left = new QVBoxLayout();

  auto* gbParams = new QGroupBox(tr("Simulation"), central);
  auto* form = new QFormLayout(gbParams);

  sbTrials_ = new QSpinBox(gbParams);
  sbTrials_->setRange(1, INT_MAX);
  sbTrials_->setGroupSeparatorShown(true);
  sbTrials_->setValue(1'000'000);
  form->addRow(tr("Trials"), sbTrials_);

  sbSeed_ = new QSpinBox(gbParams);
  sbSeed_->setRange(0, INT_MAX);
  sbSeed_->setValue(42);
  form->addRow(tr("Seed"), sbSeed_);

  sbThreads_ = new QSpinBox(gbParams);
  sbThreads_->setRange(1, 256);
  sbThreads_->setValue(static_cast<int>(std::max(1, QThread::idealThreadCount())));
  form->addRow(tr("Threads"), sbThreads_);

  sbBatch_ = new QSpinBox(gbParams);
  sbBatch_->setRange(1, INT_MAX);
  sbBatch_->setGroupSeparatorShown(true);
  sbBatch_->setValue(100'000);
  form->addRow(tr("Batch size"), sbBatch_);

  chkNoCutoff_ = new QCheckBox(tr("No cutoff (pure collector)"), gbParams);
  form->addRow(QString(), chkNoCutoff_);
  left->addWidget(gbParams);

  auto* runRow = new QHBoxLayout();
  btnRun_  = new QPushButton(tr("Run"), central);
  btnStop_ = new QPushButton(tr("Stop"), central);
  runRow->addWidget(btnRun_);
  runRow->addWidget(btnStop_);
  left->addLayout(runRow);

  progress_ = new QProgressBar(central);
  progress_->setRange(0, 1000);
  left->addWidget(progress_);

  auto* gbRes = new QGroupBox(tr("Results"), central);
  auto* resForm = new QFormLayout(gbRes);
  lblMean_    = new QLabel(gbRes);
  lblCi_      = new QLabel(gbRes);
  lblTrials_  = new QLabel(gbRes);
  lblMinMax_  = new QLabel(gbRes);
  lblElapsed_ = new QLabel(gbRes);
  lblTheory_  = new QLabel(gbRes);
  lblTheory_->setWordWrap(true);
  resForm->addRow(tr("Mean rolls"), lblMean_);
  resForm->addRow(tr("95% CI"), lblCi_);
  resForm->addRow(tr("Trials"), lblTrials_);
  resForm->addRow(tr("Min / max"), lblMinMax_);
  resForm->addRow(tr("Elapsed"), lblElapsed_);
  resForm->addRow(tr("Theory"), lblTheory_);
  left->addWidget(gbRes);

  auto* gbFiles = new QGroupBox(tr("Files"), central);
  auto* files = new QVBoxLayout(gbFiles);
  btnExportPng_ = new QPushButton(tr("Export chart PNG..."), gbFiles);
  btnExportCsv_ = new QPushButton(tr("Export histogram CSV..."), gbFiles);
  btnSave_      = new QPushButton(tr("Save session..."), gbFiles);
  btnLoad_      = new QPushButton(tr("Load session..."), gbFiles);
  files->addWidget(btnExportPng_);
  files->addWidget(btnExportCsv_);
  files->addWidget(btnSave_);
  files->addWidget(btnLoad_);
  left->addWidget(gbFiles);
  left->addStretch(1);

  // ---- droite : histogramme ----
  chart_ = new QChart();
  chartView_ = new QChartView(chart_, central);
  chartView_->setRenderHint(QPainter::Antialiasing);
  chartView_->setMinimumSize(640, 360);

  root->addLayout(left, 0);
  root->addWidget(chartView_, 1);
  setCentralWidget(central);
  resize(1280, 720);
}

void MainWindow::wireSignals() {
  connect(btnRun_,       &QPushButton::clicked, this, &MainWindow::onRun);
  connect(btnStop_,      &QPushButton::clicked, this, &MainWindow::onStop);
  connect(btnExportPng_, &QPushButton::clicked, this, &MainWindow::onExportPng);
  connect(btnExportCsv_, &QPushButton::clicked, this, &MainWindow::onExportCsv);
  connect(btnSave_,      &QPushButton::clicked, this, &MainWindow::onSaveSession);
  connect(btnLoad_,      &QPushButton::clicked, this, &MainWindow::onLoadSession);
}

pc::config::SimConfig MainWindow::configFromUi() const {
  pc::config::SimConfig cfg(
      static_cast<std::size_t>(sbTrials_->value()),
      static_cast<std::size_t>(sbBatch_->value()),
      static_cast<std::uint64_t>(sbSeed_->value()),
      static_cast<std::size_t>(sbThreads_->value()));
  if (chkNoCutoff_->isChecked()) cfg.random_draw_limit = pc::sim::kNoDrawLimit;
  return cfg;
}

void MainWindow::setRunning(bool running) {
  btnRun_->setEnabled(!running);
  btnStop_->setEnabled(running);
  btnLoad_->setEnabled(!running);
  sbTrials_->setEnabled(!running);
  sbSeed_->setEnabled(!running);
  sbThreads_->setEnabled(!running);
  sbBatch_->setEnabled(!running);
  chkNoCutoff_->setEnabled(!running);
  btnExportCsv_->setEnabled(!running && last_.has_value());
}

void MainWindow::clearResults() {
  last_.reset();
  lblMean_->setText("-");
  lblCi_->setText("-");
  lblTrials_->setText("-");
  lblMinMax_->setText("-");
  lblElapsed_->setText("-");
  lblTheory_->setText("-");
  progress_->setValue(0);
  gui::clearHistogramChart(chart_);
}

void MainWindow::setResults(const pc::sim::BatchSummary& s) {
  const double se = s.stats.std_error();
  lblMean_->setText(QString::number(s.mean_trial_length, 'f', 6));
  if (std::isfinite(se)) {
    const auto ci = pc::core::confidence_interval_95(s.mean_trial_length, se);
    lblCi_->setText(QString("[%1, %2]").arg(ci.low, 0, 'f', 4).arg(ci.high, 0, 'f', 4));
  } else {
    lblCi_->setText("-");
  }
  lblTrials_->setText(QString::number(static_cast<qulonglong>(s.n_trials)));
  lblMinMax_->setText(QString("%1 / %2")
                        .arg(static_cast<qulonglong>(s.stats.min()))
                        .arg(static_cast<qulonglong>(s.stats.max())));
  lblElapsed_->setText(QString("%1 ms").arg(s.elapsed_ms));

  const double nh = pc::core::expected_draws_unbounded(pc::core::kNumPrizes);
  if (chkNoCutoff_->isChecked()) {
    lblTheory_->setText(QString("n*H(n) = %1").arg(nh, 0, 'f', 6));
  } else {
    const auto pmf = pc::core::exact_length_pmf(pc::core::kNumPrizes, pc::sim::kRandomDrawLimit);
    lblTheory_->setText(QString("exact = %1, n*H(n) = %2")
                          .arg(pc::core::pmf_mean(pmf), 0, 'f', 6)
                          .arg(nh, 0, 'f', 6));
  }

  gui::fillHistogramChart(chart_, s.histogram);
  last_ = s;
}

void MainWindow::startSimWorker() {
  if (simThread_ && simWorker_) return;

  simThread_ = new QThread(this);
  simWorker_ = new gui::SimWorker();             // pas de parent → vit dans simThread_
  simWorker_->moveToThread(simThread_);

  connect(simThread_, &QThread::finished, simWorker_, &QObject::deleteLater);

  // Worker -> GUI
  connect(simWorker_, &gui::SimWorker::progress, this, &MainWindow::onSimProgress, Qt::QueuedConnection);
  connect(simWorker_, &gui::SimWorker::finished, this, &MainWindow::onSimFinished, Qt::QueuedConnection);
  connect(simWorker_, &gui::SimWorker::failed,   this, &MainWindow::onSimFailed,   Qt::QueuedConnection);
  connect(simWorker_, &gui::SimWorker::canceled, this, &MainWindow::onSimCanceled, Qt::QueuedConnection);

  simThread_->start();
}

void MainWindow::stopSimWorker() {
  if (!simThread_) return;

  if (simWorker_) {
    QObject::disconnect(simWorker_, nullptr, this, nullptr);
    simWorker_->requestStop();
  }

  simThread_->quit();
  simThread_->wait();

  simThread_->deleteLater();
  simThread_ = nullptr;
  simWorker_ = nullptr;
}

void MainWindow::onRun() {
  const pc::config::SimConfig cfg = configFromUi();
  try {
    cfg.validate();
  } catch (const std::exception& e) {
    QMessageBox::warning(this, tr("Simulation"), QString::fromUtf8(e.what()));
    return;
  }

  clearResults();
  runTarget_ = cfg.trial_count;
  setRunning(true);
  statusBar()->showMessage(tr("Running..."));
  qDebug() << "[UI] run trials=" << sbTrials_->value() << "threads=" << sbThreads_->value();

  startSimWorker();
  QMetaObject::invokeMethod(
    simWorker_,
    [w = simWorker_, cfg]() { w->runBatch(cfg); },
    Qt::QueuedConnection
  );
}

void MainWindow::onStop() {
  // appel direct : le worker est occupé dans runBatch
  if (simWorker_) simWorker_->requestStop();
  btnStop_->setEnabled(false);
  statusBar()->showMessage(tr("Stopping..."));
}

void MainWindow::onSimProgress(std::size_t n, double mean, double half) {
  if (runTarget_ > 0) {
    const double frac = static_cast<double>(n) / static_cast<double>(runTarget_);
    progress_->setValue(static_cast<int>(std::lround(1000.0 * frac)));
  }
  lblMean_->setText(QString::number(mean, 'f', 6));
  lblCi_->setText(QString("± %1").arg(half, 0, 'f', 4));
  lblTrials_->setText(QString::number(static_cast<qulonglong>(n)));
}

void MainWindow::onSimFinished(const pc::sim::BatchSummary& summary) {
  progress_->setValue(progress_->maximum());
  setResults(summary);
  stopSimWorker();
  setRunning(false);
  statusBar()->showMessage(
      tr("Average number of rolls to earn all prizes: %1").arg(summary.mean_trial_length, 0, 'f', 6));
}

void MainWindow::onSimFailed(const QString& why) {
  QMessageBox::warning(this, tr("Simulation failed"), why);
  stopSimWorker();
  setRunning(false);
  statusBar()->showMessage(tr("Failed"), 4000);
}

void MainWindow::onSimCanceled(std::size_t nDone) {
  stopSimWorker();
  setRunning(false);
  statusBar()->showMessage(
      tr("Run canceled after %1 trials").arg(static_cast<qulonglong>(nDone)), 4000);
}

void MainWindow::onExportPng() {
  const QString suggested = QDir::current().filePath(
      QString("%1-sim.png").arg(last_ ? static_cast<qulonglong>(last_->n_trials) : 0ULL));
  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Export chart"), suggested, tr("PNG (*.png)"));
  if (fn.isEmpty()) return;

  if (gui::saveWidgetPng(chartView_, fn, QSize(), 2.0)) {
    statusBar()->showMessage(tr("Chart saved to %1").arg(QDir::toNativeSeparators(fn)), 3000);
  } else {
    QMessageBox::warning(this, tr("Export chart"), tr("Cannot write %1").arg(fn));
  }
}

void MainWindow::onExportCsv() {
  if (!last_) return;
  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Export histogram"), QDir::current().filePath("histogram.csv"), tr("CSV (*.csv)"));
  if (fn.isEmpty()) return;

  try {
    pc::io::write_histogram_csv(fn.toStdString(), *last_);
  } catch (const std::exception& e) {
    QMessageBox::warning(this, tr("Export histogram"), QString::fromUtf8(e.what()));
    return;
  }
  statusBar()->showMessage(tr("Histogram saved to %1").arg(QDir::toNativeSeparators(fn)), 3000);
}

QJsonObject MainWindow::makeSessionJson() const {
  QJsonObject root;
  root["app"] = "prizecollect";
  root["saved_at"] = QDateTime::currentDateTime().toString(Qt::ISODate);

  root["config"] = QJsonObject{
    {"trials",    sbTrials_->value()},
    {"seed",      sbSeed_->value()},
    {"threads",   sbThreads_->value()},
    {"batch",     sbBatch_->value()},
    {"no_cutoff", chkNoCutoff_->isChecked()}
  };

  if (last_) {
    QJsonArray bins;
    for (const auto& kv : last_->histogram) {
      bins.append(QJsonObject{
        {"length", static_cast<double>(kv.first)},
        {"count",  static_cast<double>(kv.second)}
      });
    }
    root["result"] = QJsonObject{
      {"n_trials",   static_cast<double>(last_->n_trials)},
      {"mean",       last_->mean_trial_length},
      {"elapsed_ms", static_cast<double>(last_->elapsed_ms)},
      {"histogram",  bins}
    };
  }
  return root;
}

void MainWindow::loadSessionJson(const QJsonObject& root) {
  if (auto c = root["config"].toObject(); !c.isEmpty()) {
    sbTrials_->setValue(c["trials"].toInt(sbTrials_->value()));
    sbSeed_->setValue(c["seed"].toInt(sbSeed_->value()));
    sbThreads_->setValue(c["threads"].toInt(sbThreads_->value()));
    sbBatch_->setValue(c["batch"].toInt(sbBatch_->value()));
    chkNoCutoff_->setChecked(c["no_cutoff"].toBool(false));
  }

  clearResults();
  const QJsonObject r = root["result"].toObject();
  const QJsonArray bins = r["histogram"].toArray();
  if (bins.isEmpty()) return;

  const std::size_t maxLen = chkNoCutoff_->isChecked() ? kMaxUncutLength
                                                       : pc::sim::kMaxTrialLength;
  pc::sim::Histogram h;
  int ignored = 0;
  for (const QJsonValue& v : bins) {
    const QJsonObject b = v.toObject();
    std::size_t len = 0;
    std::uint64_t cnt = 0;
    if (!pc::sim::bin_from_real(b["length"].toDouble(-1.0), b["count"].toDouble(-1.0),
                                pc::sim::kMinTrialLength, maxLen, len, cnt)
        || h.count(len) != 0) {   // doublon : ignoré
      ++ignored;
      continue;
    }
    h.add(len, cnt);
  }
  if (ignored > 0) qDebug() << "[UI] session: ignored bins =" << ignored;
  if (h.empty()) return;

  pc::sim::BatchSummary s = pc::sim::summarize(h);
  s.elapsed_ms = static_cast<long long>(r["elapsed_ms"].toDouble(0.0));
  setResults(s);
}

void MainWindow::onSaveSession() {
  const QString suggested = QDir::current().filePath(
      "session_" + QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss") + ".json");
  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Save session"), suggested, tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::WriteOnly)) {
    QMessageBox::warning(this, tr("Save session"), tr("Cannot open file for writing."));
    return;
  }
  QJsonDocument doc(makeSessionJson());
  f.write(doc.toJson(QJsonDocument::Indented));
  f.close();
  statusBar()->showMessage(tr("Session saved to %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

void MainWindow::onLoadSession() {
  const QString fn = QFileDialog::getOpenFileName(
      this, tr("Load session"), QDir::currentPath(), tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::ReadOnly)) {
    QMessageBox::warning(this, tr("Load session"), tr("Cannot open file for reading."));
    return;
  }
  const QByteArray bytes = f.readAll(); f.close();
  const QJsonDocument doc = QJsonDocument::fromJson(bytes);
  if (!doc.isObject()) {
    QMessageBox::warning(this, tr("Load session"), tr("Invalid JSON file."));
    return;
  }
  loadSessionJson(doc.object());
  setRunning(false);
  qDebug() << "[UI] session loaded from" << fn;
  statusBar()->showMessage(tr("Session loaded from %1").arg(QDir::toNativeSeparators(fn)), 2000);
}
