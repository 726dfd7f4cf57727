#include <pc/config/sim_config.hpp>
#include <pc/core/outcome.hpp>
#include <pc/core/theory.hpp>
#include <pc/core/uniform_rng.hpp>
#include <pc/sim/batch.hpp>
#include <pc/sim/trial.hpp>

#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

template <class F>
static bool throws_invalid_argument(F&& f) {
  try { f(); } catch (const std::invalid_argument&) { return true; }
  return false;
}

static void check_keys_in_range(const pc::sim::Histogram& h) {
  for (const auto& kv : h) {
    assert(kv.first >= pc::sim::kMinTrialLength);
    assert(kv.first <= pc::sim::kMaxTrialLength);
    assert(kv.second > 0);
  }
}

int main() {
  // 1) Taille de lot nulle rejetée, sans division
  {
    pc::core::UniformRng rng(1);
    assert(throws_invalid_argument([&] { (void)pc::sim::run_batch(0, rng); }));
    assert(throws_invalid_argument([&] { (void)pc::sim::summarize(std::vector<std::size_t>{}); }));
    assert(throws_invalid_argument([&] { (void)pc::sim::summarize(pc::sim::Histogram{}); }));
  }

  // 2) Lot d'un seul essai : une clé, compte 1, moyenne = longueur
  {
    pc::core::UniformRng a(99), b(99);
    const auto res = pc::sim::run_batch(1, a);
    const std::size_t len = pc::sim::run_trial(b).size();
    assert(res.histogram.size() == 1);
    assert(res.histogram.count(len) == 1);
    assert(res.mean_trial_length == static_cast<double>(len));
    assert(res.n_trials == 1);
  }

  // 3) Recalcul manuel depuis les longueurs brutes : accord exact
  {
    const std::size_t N = 5000;
    pc::core::UniformRng a(12345), b(12345);
    const auto res = pc::sim::run_batch(N, a);

    std::vector<std::size_t> lengths;
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < N; ++i) {
      lengths.push_back(pc::sim::run_trial(b).size());
      sum += lengths.back();
    }
    const auto again = pc::sim::summarize(lengths);

    assert(res.histogram == again.histogram);
    assert(res.histogram.total() == N);
    assert(res.mean_trial_length == again.mean_trial_length);
    assert(res.mean_trial_length == static_cast<double>(sum) / static_cast<double>(N));
    check_keys_in_range(res.histogram);

    // Même résumé reconstruit depuis l'histogramme seul
    const auto from_hist = pc::sim::summarize(res.histogram);
    assert(from_hist.histogram == res.histogram);
    assert(from_hist.n_trials == N);
    assert(from_hist.mean_trial_length == res.mean_trial_length);
    assert(from_hist.stats.variance() == res.stats.variance());
    assert(from_hist.stats.min() == res.stats.min() && from_hist.stats.max() == res.stats.max());
  }

  // 3b) Reconstruction en O(clés) : comptes énormes sans boucle par essai
  {
    pc::sim::Histogram h;
    h.add(8, 1'000'000'000'000ULL);
    h.add(32, 3);
    const auto s = pc::sim::summarize(h);
    assert(s.n_trials == 1'000'000'000'003ULL);
    assert(s.stats.sum() == 8'000'000'000'000ULL + 96);
    assert(s.stats.min() == 8 && s.stats.max() == 32);
    assert(std::abs(s.mean_trial_length - 8.0) < 1e-9);
  }

  // 4) Grand échantillon vs loi exacte du processus simulé (coupure 25)
  {
    const std::size_t N = 1'000'000;
    pc::core::UniformRng rng(20240611);
    const auto res = pc::sim::run_batch(N, rng);
    check_keys_in_range(res.histogram);

    const auto pmf = pc::core::exact_length_pmf(pc::core::kNumPrizes, pc::sim::kRandomDrawLimit);
    const double mean_th = pc::core::pmf_mean(pmf);
    assert(std::abs(res.mean_trial_length - mean_th) / mean_th < 0.02);
    // plus serré : 6 erreurs standard
    assert(std::abs(res.mean_trial_length - mean_th) < 6.0 * res.stats.std_error());

    for (std::size_t L = 0; L < pmf.size(); ++L) {
      const double p = pmf[L];
      const double p_emp = static_cast<double>(res.histogram.count(L)) / static_cast<double>(N);
      const double tol = 6.0 * std::sqrt(p * (1.0 - p) / static_cast<double>(N)) + 1e-6;
      assert(std::abs(p_emp - p) < tol);
    }
  }

  // 5) Sans coupure : moyenne ≈ 8 * H(8) ≈ 21.74 (±2 %)
  {
    pc::config::SimConfig cfg(200'000, 50'000, 31337ULL, 1, pc::sim::kNoDrawLimit);
    pc::sim::BatchRunner runner(cfg);
    const auto res = runner.run();
    const double th = pc::core::expected_draws_unbounded(pc::core::kNumPrizes);
    assert(std::abs(th - 21.742857142857142) < 1e-9);
    assert(std::abs(res.mean_trial_length - th) / th < 0.02);
  }

  // 6) BatchRunner séquentiel : reproductible, progression par lot
  {
    pc::config::SimConfig cfg(10'500, 1'000, 42ULL, 1);
    std::vector<pc::sim::BatchProgress> seen;
    pc::sim::BatchRunner r1(cfg);
    r1.set_progress_callback([&](const pc::sim::BatchProgress& p) { seen.push_back(p); });
    const auto a = r1.run();

    pc::sim::BatchRunner r2(cfg);
    const auto b = r2.run();

    assert(a.completed && b.completed);
    assert(a.histogram == b.histogram);
    assert(a.mean_trial_length == b.mean_trial_length);
    assert(a.n_trials == 10'500);

    assert(seen.size() == 11);
    for (std::size_t i = 1; i < seen.size(); ++i) assert(seen[i].n_done > seen[i - 1].n_done);
    assert(seen.back().n_done == 10'500);
    assert(seen.back().mean == a.mean_trial_length);
    assert(seen.back().half_width_95 > 0.0);

    // même graine, même politique : identique à run_batch sur un UniformRng
    pc::core::UniformRng rng(42ULL);
    const auto ref = pc::sim::run_batch(10'500, rng);
    assert(ref.histogram == a.histogram);
  }

  // 7) BatchRunner parallèle : total exact, reproductible à config égale
  {
    pc::config::SimConfig cfg(100'003, 5'000, 7ULL, 4);
    pc::sim::BatchRunner r1(cfg), r2(cfg);
    std::size_t last = 0;
    r1.set_progress_callback([&](const pc::sim::BatchProgress& p) {
      assert(p.n_done >= last);
      last = p.n_done;
    });
    const auto a = r1.run();
    const auto b = r2.run();
    assert(a.completed);
    assert(a.n_trials == 100'003);
    assert(a.histogram.total() == 100'003);
    assert(a.histogram == b.histogram);
    assert(last == 100'003);
    check_keys_in_range(a.histogram);
  }

  // 8) Moins d'essais que de workers
  {
    pc::sim::BatchRunner r(pc::config::SimConfig(3, 10, 5ULL, 8));
    const auto res = r.run();
    assert(res.n_trials == 3);
    assert(res.histogram.total() == 3);
  }

  // 9) Arrêt coopératif après le premier lot
  {
    pc::sim::BatchRunner r(pc::config::SimConfig(100'000, 1'000, 3ULL, 1));
    r.set_progress_callback([&](const pc::sim::BatchProgress&) { r.request_stop(); });
    const auto res = r.run();
    assert(!res.completed);
    assert(res.n_trials == 1'000);
    assert(res.histogram.total() == 1'000);
  }
  {
    pc::sim::BatchRunner r(pc::config::SimConfig(4'000'000, 1'000, 3ULL, 2));
    r.set_progress_callback([&](const pc::sim::BatchProgress&) { r.request_stop(); });
    const auto res = r.run();
    assert(!res.completed);
    assert(res.n_trials < 4'000'000);
    assert(res.n_trials % 1'000 == 0);
  }

  // 10) Arrêt avant le premier essai : rien à résumer
  {
    pc::sim::BatchRunner r(pc::config::SimConfig(1'000, 100, 3ULL, 1));
    r.request_stop();
    assert(throws_invalid_argument([&] { (void)r.run(); }));
  }

  // 11) Configurations invalides
  assert(throws_invalid_argument([] { pc::sim::BatchRunner r(pc::config::SimConfig(0)); }));
  assert(throws_invalid_argument([] { pc::sim::BatchRunner r(pc::config::SimConfig(10, 0)); }));
  assert(throws_invalid_argument([] { pc::sim::BatchRunner r(pc::config::SimConfig(10, 10, 1ULL, 0)); }));
  assert(throws_invalid_argument([] { pc::sim::BatchRunner r(pc::config::SimConfig(10, 10, 1ULL, 1, 5)); }));

  std::cout << "Batch aggregator OK.\n";
  return 0;
}
