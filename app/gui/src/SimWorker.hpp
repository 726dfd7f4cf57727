#pragma once
#include <QObject>
#include <QMetaType>
#include <QString>
#include <atomic>
#include <cstddef>

// types passés par valeur dans les signaux ⇒ on inclut ici
#include <pc/config/sim_config.hpp>
#include <pc/sim/batch.hpp>

namespace gui {

/**
 * Worker vivant dans un QThread : exécute un BatchRunner et remonte
 * progression / résultat par signaux (connexions Qt::QueuedConnection).
 * Un worker par run : une fois arrêté, il le reste.
 */
class SimWorker : public QObject {
  Q_OBJECT
public:
  explicit SimWorker(QObject* parent = nullptr);
  ~SimWorker() override = default;

  // Demande d'arrêt, appelable directement depuis le thread GUI (atomique).
  void requestStop();

public slots:
  // Simulation complète (séquentielle ou multi-thread selon cfg.n_threads).
  void runBatch(pc::config::SimConfig cfg);

signals:
  void progress(std::size_t nDone, double mean, double halfwidth95);
  void finished(pc::sim::BatchSummary summary);
  void failed(QString why);
  void canceled(std::size_t nDone);

private:
  std::atomic<bool> stop_{false};
};

} // namespace gui

Q_DECLARE_METATYPE(pc::config::SimConfig)
Q_DECLARE_METATYPE(pc::sim::BatchSummary)
