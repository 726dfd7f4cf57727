#pragma once
#include <QMainWindow>
#include <QThread>
#include <QJsonObject>
#include <QString>
#include <cstddef>
#include <optional>

#include <QtCharts/QChart>
#include <QtCharts/QChartView>

#include <pc/config/sim_config.hpp>
#include <pc/sim/batch.hpp>

namespace gui { class SimWorker; }

class QSpinBox;
class QCheckBox;
class QPushButton;
class QProgressBar;
class QLabel;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onRun();
  void onStop();

  // Callbacks worker
  void onSimProgress(std::size_t n, double mean, double half);
  void onSimFinished(const pc::sim::BatchSummary& summary);
  void onSimFailed(const QString& why);
  void onSimCanceled(std::size_t nDone);

  void onExportPng();
  void onExportCsv();
  void onSaveSession();
  void onLoadSession();

private:
  // Construction de l'interface (widgets créés dans le code)
  void buildUi();
  void wireSignals();

  pc::config::SimConfig configFromUi() const;
  void setRunning(bool running);
  void setResults(const pc::sim::BatchSummary& s);
  void clearResults();

  // Gestion worker
  void startSimWorker();
  void stopSimWorker();

  // Session JSON
  QJsonObject makeSessionJson() const;
  void        loadSessionJson(const QJsonObject& root);

  // Entrées
  QSpinBox*  sbTrials_{nullptr};
  QSpinBox*  sbSeed_{nullptr};
  QSpinBox*  sbThreads_{nullptr};
  QSpinBox*  sbBatch_{nullptr};
  QCheckBox* chkNoCutoff_{nullptr};

  // Actions
  QPushButton* btnRun_{nullptr};
  QPushButton* btnStop_{nullptr};
  QPushButton* btnExportPng_{nullptr};
  QPushButton* btnExportCsv_{nullptr};
  QPushButton* btnSave_{nullptr};
  QPushButton* btnLoad_{nullptr};

  QProgressBar* progress_{nullptr};

  // Résultats
  QLabel* lblMean_{nullptr};
  QLabel* lblCi_{nullptr};
  QLabel* lblTrials_{nullptr};
  QLabel* lblMinMax_{nullptr};
  QLabel* lblElapsed_{nullptr};
  QLabel* lblTheory_{nullptr};

  // Histogramme
  QtCharts::QChartView* chartView_{nullptr};
  QtCharts::QChart*     chart_{nullptr};

  // Worker thread
  QThread*        simThread_{nullptr};
  gui::SimWorker* simWorker_{nullptr};

  std::size_t runTarget_{0};
  std::optional<pc::sim::BatchSummary> last_;
};
