#include "SimWorker.hpp"

#include <exception>

#include <QDebug>

namespace gui {

SimWorker::SimWorker(QObject* parent) : QObject(parent) {}

void SimWorker::requestStop() {
  stop_.store(true, std::memory_order_relaxed);
  qDebug() << "[Worker] stop requested";
}

void SimWorker::runBatch(pc::config::SimConfig cfg)
{
  // stop_ n'est pas remis à zéro : un arrêt demandé avant le départ compte
  try {
    qDebug() << "[Worker] runBatch"
             << "trials=" << static_cast<qulonglong>(cfg.trial_count)
             << "batch=" << static_cast<qulonglong>(cfg.batch_size)
             << "seed=" << static_cast<qulonglong>(cfg.seed)
             << "threads=" << static_cast<qulonglong>(cfg.n_threads)
             << "cutoff=" << static_cast<qulonglong>(cfg.random_draw_limit);

    pc::sim::BatchRunner runner(cfg);

    // Appelé sur ce thread après chaque lot : relai progression + arrêt
    runner.set_progress_callback([this, &runner](const pc::sim::BatchProgress& p) {
      emit progress(p.n_done, p.mean, p.half_width_95);
      if (stop_.load(std::memory_order_relaxed)) runner.request_stop();
    });

    pc::sim::BatchSummary res = runner.run();

    qDebug() << "[Worker] done"
             << "n=" << static_cast<qulonglong>(res.n_trials)
             << "mean=" << res.mean_trial_length
             << "ms=" << res.elapsed_ms
             << "completed=" << res.completed;

    if (!res.completed) {
      emit canceled(res.n_trials);
      return;
    }
    emit finished(res);
  } catch (const std::exception& e) {
    qDebug() << "[Worker] failed:" << e.what();
    emit failed(QString::fromUtf8(e.what()));
  } catch (...) {
    emit failed("Unknown error in SimWorker::runBatch");
  }
}

} // namespace gui
