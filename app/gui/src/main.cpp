#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QPainter>

#include <QtCharts/QChart>
#include <QtCharts/QChartView>

#include <cstdint>
#include <exception>
#include <iostream>

#include "HistogramChart.hpp"
#include "MainWindow.hpp"

#include <pc/config/sim_config.hpp>
#include <pc/sim/batch.hpp>

namespace {

// Mode sans fenêtre : un lot, rendu 1280x720 dans un PNG, puis sortie.
int renderPng(const QString& path, const pc::config::SimConfig& cfg) {
  pc::sim::BatchRunner runner(cfg);
  const pc::sim::BatchSummary res = runner.run();
  std::cout << "Average number of rolls to earn all prizes: " << res.mean_trial_length << "\n";

  auto* chart = new QtCharts::QChart();
  QtCharts::QChartView view(chart);   // la vue possède le chart
  view.setRenderHint(QPainter::Antialiasing);
  gui::fillHistogramChart(chart, res.histogram);

  const QFileInfo fi(path);
  QDir().mkpath(fi.absolutePath());
  if (!gui::saveWidgetPng(&view, path, QSize(1280, 720), 1.0)) {
    std::cerr << "Cannot write PNG: " << path.toStdString() << "\n";
    return 2;
  }
  qDebug() << "[Headless] chart written to" << fi.absoluteFilePath();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  QApplication::setApplicationName("pc_gui");

  QCommandLineParser parser;
  parser.setApplicationDescription("Prize collector simulation");
  parser.addHelpOption();
  const QCommandLineOption optPng("png", "Render the histogram of a fresh batch to FILE and exit.", "FILE");
  const QCommandLineOption optTrials("trials", "Number of trials (headless mode).", "N", "100");
  const QCommandLineOption optSeed("seed", "Master seed (headless mode).", "S", "42");
  const QCommandLineOption optThreads("threads", "Worker threads (headless mode).", "T", "1");
  parser.addOption(optPng);
  parser.addOption(optTrials);
  parser.addOption(optSeed);
  parser.addOption(optThreads);
  parser.process(app);

  if (parser.isSet(optPng)) {
    bool okN = false, okS = false, okT = false;
    const qulonglong n = parser.value(optTrials).toULongLong(&okN);
    const qulonglong s = parser.value(optSeed).toULongLong(&okS);
    const qulonglong t = parser.value(optThreads).toULongLong(&okT);
    if (!okN || !okS || !okT || n == 0 || t == 0) {
      std::cerr << "Invalid --trials/--seed/--threads value\n";
      return 1;
    }
    try {
      pc::config::SimConfig cfg(static_cast<std::size_t>(n), 100'000,
                                static_cast<std::uint64_t>(s),
                                static_cast<std::size_t>(t));
      return renderPng(parser.value(optPng), cfg);
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 3;
    }
  }

  MainWindow w;
  w.show();
  return app.exec();
}
