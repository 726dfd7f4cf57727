#include "HistogramChart.hpp"

#include <QColor>
#include <QFont>
#include <QImage>
#include <QPainter>
#include <QStringList>
#include <QWidget>

#include <QtCharts/QBarCategoryAxis>
#include <QtCharts/QBarSeries>
#include <QtCharts/QBarSet>
#include <QtCharts/QValueAxis>

#include <cstdint>
#include <vector>

using namespace QtCharts;

namespace {
const QColor C_BAR(33, 150, 243); // bleu
const qreal  BAR_WIDTH = 0.85;

void dropAxes(QChart* chart) {
  const auto axes = chart->axes();
  for (QAbstractAxis* ax : axes) {
    chart->removeAxis(ax);
    delete ax;
  }
}
} // namespace

namespace gui {

void clearHistogramChart(QChart* chart) {
  if (!chart) return;
  chart->removeAllSeries();
  dropAxes(chart);
  chart->setTitle("No run yet");
}

void fillHistogramChart(QChart* chart,
                        const pc::sim::Histogram& hist,
                        std::size_t first, std::size_t last)
{
  if (!chart) return;
  chart->removeAllSeries();
  dropAxes(chart);

  const std::vector<std::uint64_t> counts = hist.bucket_counts(first, last);

  auto* set = new QBarSet("trials");
  set->setColor(C_BAR);
  set->setBorderColor(C_BAR);
  QStringList cats;
  std::uint64_t maxShown = 0;
  for (std::size_t i = 0; i < counts.size(); ++i) {
    *set << static_cast<qreal>(counts[i]);
    cats << QString::number(static_cast<qulonglong>(first + i));
    if (counts[i] > maxShown) maxShown = counts[i];
  }

  auto* series = new QBarSeries(chart);
  series->setBarWidth(BAR_WIDTH);
  series->append(set);
  chart->addSeries(series);

  auto* ax = new QBarCategoryAxis(chart);
  ax->append(cats);
  ax->setTitleText("rolls to earn all prizes");
  chart->addAxis(ax, Qt::AlignBottom);
  series->attachAxis(ax);

  auto* ay = new QValueAxis(chart);
  ay->setRange(0.0, static_cast<qreal>(hist.max_count() + 5));
  ay->setLabelFormat("%d");
  ay->setTitleText("trials");
  chart->addAxis(ay, Qt::AlignLeft);
  series->attachAxis(ay);

  chart->legend()->setVisible(false);
  chart->setTitle(QString("%1 trials").arg(static_cast<qulonglong>(hist.total())));

  const QFont f("Calibri", 14);
  ax->setLabelsFont(f);
  ay->setLabelsFont(f);
}

bool saveWidgetPng(QWidget* w, const QString& outPath,
                   const QSize& targetPx, qreal dpr) {
  if (!w) return false;
  if (targetPx.isValid()) w->resize(targetPx);
  const QSize base = w->size();
  const QSize hi(int(base.width() * dpr), int(base.height() * dpr));

  QImage img(hi, QImage::Format_ARGB32_Premultiplied);
  img.setDevicePixelRatio(dpr);
  img.fill(Qt::white);

  QPainter p(&img);
  p.setRenderHint(QPainter::Antialiasing);
  w->render(&p);
  p.end();
  return img.save(outPath, "PNG");
}

} // namespace gui
