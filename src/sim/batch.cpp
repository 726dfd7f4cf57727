#include <pc/sim/batch.hpp>

#include <algorithm>          // std::min
#include <chrono>             // steady_clock
#include <condition_variable>
#include <exception>          // std::exception_ptr
#include <mutex>
#include <stdexcept>          // std::invalid_argument
#include <thread>
#include <utility>            // std::move

namespace pc {
namespace sim {

namespace {

using clock_type = std::chrono::steady_clock;

long long elapsed_ms_since(clock_type::time_point t0) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - t0).count();
}

BatchSummary make_summary(Histogram hist, const pc::core::LengthStats& stats) {
  if (stats.count() == 0) {
    throw std::invalid_argument("batch: no trial was simulated (trial_count must be >= 1)");
  }
  BatchSummary res;
  res.mean_trial_length = stats.mean();
  res.histogram = std::move(hist);
  res.stats     = stats;
  res.n_trials  = stats.count();
  return res;
}

BatchProgress progress_of(const pc::core::LengthStats& acc) {
  const double se = acc.std_error();
  return { acc.count(), acc.mean(), pc::core::half_width_95(se) };
}

} // anonymous namespace

// --- Réduction ---------------------------------------------------------------

BatchSummary summarize(const std::vector<std::size_t>& lengths) {
  if (lengths.empty()) {
    throw std::invalid_argument("summarize: at least one trial length is required");
  }
  Histogram hist;
  pc::core::LengthStats stats;
  for (std::size_t len : lengths) {
    hist.add(len);
    stats.add(len);
  }
  return make_summary(std::move(hist), stats);
}

BatchSummary summarize(const Histogram& hist) {
  if (hist.empty()) {
    throw std::invalid_argument("summarize: histogram is empty");
  }
  pc::core::LengthStats stats;
  for (const auto& kv : hist) {
    stats.add(kv.first, kv.second);
  }
  return make_summary(hist, stats);
}

BatchSummary run_batch(std::size_t trial_count,
                       pc::core::DrawSource& rng,
                       const TrialOptions& opts) {
  if (trial_count == 0) {
    throw std::invalid_argument("run_batch: trial_count must be >= 1");
  }
  const auto t0 = clock_type::now();

  std::vector<std::size_t> lengths;
  lengths.reserve(trial_count);
  for (std::size_t i = 0; i < trial_count; ++i) {
    lengths.push_back(run_trial(rng, opts).size());
  }

  BatchSummary res = summarize(lengths);
  res.elapsed_ms = elapsed_ms_since(t0);
  return res;
}

// --- BatchRunner -------------------------------------------------------------

BatchRunner::BatchRunner(pc::config::SimConfig cfg) : cfg_(cfg) {
  cfg_.validate();
}

BatchSummary BatchRunner::run() {
  return (cfg_.n_threads <= 1) ? run_sequential_() : run_parallel_();
}

BatchSummary BatchRunner::run_sequential_() {
  const auto t0 = clock_type::now();
  const TrialOptions opts{cfg_.random_draw_limit};

  pc::core::UniformRng rng(cfg_.seed);
  Histogram hist;
  pc::core::LengthStats acc;
  std::size_t Ncum = 0;

  // Boucle par lots
  while (Ncum < cfg_.trial_count && !stop_.load(std::memory_order_relaxed)) {
    const std::size_t budget = cfg_.trial_count - Ncum;
    const std::size_t batchN = std::min(cfg_.batch_size, budget);

    for (std::size_t i = 0; i < batchN; ++i) {
      const std::size_t len = trial_length(rng, opts);
      hist.add(len);
      acc.add(len);
    }
    Ncum += batchN;

    if (progress_) progress_(progress_of(acc));
  }

  BatchSummary res = make_summary(std::move(hist), acc);
  res.completed  = (Ncum == cfg_.trial_count);
  res.elapsed_ms = elapsed_ms_since(t0);
  return res;
}

BatchSummary BatchRunner::run_parallel_() {
  const auto t0 = clock_type::now();
  const TrialOptions opts{cfg_.random_draw_limit};
  const std::size_t nWorkers = std::min(cfg_.n_threads, cfg_.trial_count);

  struct WorkerOut {
    Histogram hist;
    pc::core::LengthStats stats;
  };
  std::vector<WorkerOut> outs(nWorkers);

  // État partagé pour la progression : stats cumulées des lots terminés.
  std::mutex mtx;
  std::condition_variable cv;
  pc::core::LengthStats shared;
  std::size_t batches_done = 0;
  std::size_t workers_done = 0;

  // Les `rem` premiers workers font un essai de plus.
  const std::size_t chunk = cfg_.trial_count / nWorkers;
  const std::size_t rem   = cfg_.trial_count % nWorkers;

  std::vector<std::exception_ptr> errors(nWorkers);

  auto worker = [&](std::size_t id, std::size_t trials) {
    try {
      pc::core::UniformRng rng(pc::core::derive_seed(cfg_.seed, id));
      WorkerOut& out = outs[id];
      std::size_t done = 0;

      while (done < trials && !stop_.load(std::memory_order_relaxed)) {
        const std::size_t batchN = std::min(cfg_.batch_size, trials - done);
        pc::core::LengthStats local;
        for (std::size_t i = 0; i < batchN; ++i) {
          const std::size_t len = trial_length(rng, opts);
          out.hist.add(len);
          local.add(len);
        }
        out.stats.merge(local);
        done += batchN;

        {
          std::lock_guard<std::mutex> lk(mtx);
          shared.merge(local);
          ++batches_done;
        }
        cv.notify_one();
      }
    } catch (...) {
      errors[id] = std::current_exception();
      stop_.store(true, std::memory_order_relaxed);
    }

    {
      std::lock_guard<std::mutex> lk(mtx);
      ++workers_done;
    }
    cv.notify_one();
  };

  std::vector<std::thread> threads;
  threads.reserve(nWorkers);
  for (std::size_t i = 0; i < nWorkers; ++i) {
    const std::size_t trials = chunk + (i < rem ? 1 : 0);
    threads.emplace_back(worker, i, trials);
  }

  // Progression remontée sur le thread appelant.
  try {
    std::size_t reported = 0;
    for (;;) {
      pc::core::LengthStats snapshot;
      bool all_done = false;
      {
        std::unique_lock<std::mutex> lk(mtx);
        cv.wait(lk, [&] { return batches_done != reported || workers_done == nWorkers; });
        if (batches_done != reported) {
          reported = batches_done;
          snapshot = shared;
        }
        all_done = (workers_done == nWorkers);
      }
      if (snapshot.count() > 0 && progress_) progress_(progress_of(snapshot));
      if (all_done) break;
    }
  } catch (...) {
    // Rappel de progression en échec : on arrête les workers avant de propager.
    stop_.store(true, std::memory_order_relaxed);
    for (auto& th : threads) th.join();
    throw;
  }

  for (auto& th : threads) th.join();

  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }

  // Fusion des résultats des workers
  Histogram hist;
  pc::core::LengthStats acc;
  for (const auto& o : outs) {
    hist.merge(o.hist);
    acc.merge(o.stats);
  }

  BatchSummary res = make_summary(std::move(hist), acc);
  res.completed  = (acc.count() == cfg_.trial_count);
  res.elapsed_ms = elapsed_ms_since(t0);
  return res;
}

} // namespace sim
} // namespace pc
