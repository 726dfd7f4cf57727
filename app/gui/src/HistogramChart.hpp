#pragma once
#include <QSize>
#include <QString>
#include <cstddef>

#include <QtCharts/QChart>

#include <pc/config/sim_config.hpp>
#include <pc/sim/histogram.hpp>

class QWidget;

namespace gui {

/**
 * Remplit `chart` avec l'histogramme des longueurs d'essai :
 * - une barre par longueur de [first, last) (les seaux vides valent 0),
 * - axe Y de 0 à (compte max + 5).
 * Les séries et axes précédents sont retirés.
 */
void fillHistogramChart(QtCharts::QChart* chart,
                        const pc::sim::Histogram& hist,
                        std::size_t first = pc::config::kPlotFirstBucket,
                        std::size_t last  = pc::config::kPlotLastBucket);

// Remet le graphique dans l'état "aucun run".
void clearHistogramChart(QtCharts::QChart* chart);

// Rend un widget dans un PNG (targetPx invalide ⇒ taille du widget).
bool saveWidgetPng(QWidget* w,
                   const QString& outPath,
                   const QSize& targetPx = QSize(),
                   qreal devicePixelRatio = 2.0);

} // namespace gui
