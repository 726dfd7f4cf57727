#include <pc/core/stats.hpp>
#include <pc/core/theory.hpp>
#include <pc/core/uniform_rng.hpp>

#include <cassert>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <numeric>
#include <set>
#include <stdexcept>
#include <vector>

int main() {
  // 1) LengthStats : moyenne exacte, variance d'échantillon, min/max
  {
    pc::core::LengthStats s;
    assert(s.count() == 0);
    assert(std::isnan(s.mean()));
    assert(std::isnan(s.std_error()));

    s.add(8);
    assert(s.mean() == 8.0);
    assert(std::isnan(s.variance()));

    for (std::size_t x : {10, 12, 30}) s.add(x);
    assert(s.count() == 4);
    assert(s.sum() == 60);
    assert(s.mean() == 15.0);
    assert(s.min() == 8 && s.max() == 30);
    // Σ(x-15)^2 = 49 + 25 + 9 + 225 = 308 ; /3
    assert(std::abs(s.variance() - 308.0 / 3.0) < 1e-12);
    assert(std::abs(s.std_error() - std::sqrt(308.0 / 3.0 / 4.0)) < 1e-12);
  }

  // 2) merge = une seule passe
  {
    pc::core::LengthStats all, left, right;
    for (std::size_t i = 0; i < 1000; ++i) {
      const std::size_t x = 8 + (i * 7) % 25;
      all.add(x);
      (i % 3 == 0 ? left : right).add(x);
    }
    pc::core::LengthStats m = left;
    m.merge(right);
    assert(m.count() == all.count());
    assert(m.sum() == all.sum());
    assert(m.mean() == all.mean());
    assert(m.variance() == all.variance());
    assert(m.min() == all.min() && m.max() == all.max());

    pc::core::LengthStats empty;
    empty.merge(all);
    assert(empty.min() == all.min());
  }

  // 2b) add(longueur, compte) = compte appels à add(longueur)
  {
    pc::core::LengthStats bulk, one_by_one;
    bulk.add(12, 3);
    bulk.add(9, 0); // ignoré
    bulk.add(30, 2);
    for (int i = 0; i < 3; ++i) one_by_one.add(12);
    for (int i = 0; i < 2; ++i) one_by_one.add(30);
    assert(bulk.count() == one_by_one.count());
    assert(bulk.sum() == one_by_one.sum());
    assert(bulk.variance() == one_by_one.variance());
    assert(bulk.min() == 12 && bulk.max() == 30);

    pc::core::LengthStats huge;
    huge.add(20, 1'000'000'000'000ULL);
    assert(huge.count() == 1'000'000'000'000ULL);
    assert(huge.mean() == 20.0);
    assert(huge.variance() == 0.0);
  }

  // 3) IC 95 %
  {
    const auto ci = pc::core::confidence_interval_95(20.0, 0.5);
    assert(std::abs((ci.high - ci.low) - 2.0 * 1.959963984540054 * 0.5) < 1e-12);
    assert(std::abs(0.5 * (ci.high + ci.low) - 20.0) < 1e-12);
  }

  // 4) Théorie : H(8), n*H(n)
  assert(pc::core::harmonic(0) == 0.0);
  assert(std::abs(pc::core::harmonic(8) - 761.0 / 280.0) < 1e-12);
  assert(std::abs(pc::core::expected_draws_unbounded(8) - 761.0 / 35.0) < 1e-12);

  // 5) Loi exacte avec coupure à 25
  {
    const auto pmf = pc::core::exact_length_pmf(8, 25);
    assert(pmf.size() == 33); // longueurs 0..32
    const double total = std::accumulate(pmf.begin(), pmf.end(), 0.0);
    assert(std::abs(total - 1.0) < 1e-12);
    for (std::size_t L = 0; L < 8; ++L) assert(pmf[L] == 0.0);
    for (std::size_t L = 8; L <= 32; ++L) assert(pmf[L] >= 0.0);
    // P(8) = 8! / 8^8
    assert(std::abs(pmf[8] - 40320.0 / 16777216.0) < 1e-15);
    // La masse des longueurs 26..32 est celle des essais incomplets après 25 tirages.
    assert(pmf[26] > pmf[25]);
    const double mean = pc::core::pmf_mean(pmf);
    assert(std::abs(mean - 19.838) < 1e-3);
    assert(mean < pc::core::expected_draws_unbounded(8));
  }

  // 6) Coupure très lointaine : on retrouve n*H(n)
  {
    const auto pmf = pc::core::exact_length_pmf(8, 600);
    assert(std::abs(pc::core::pmf_mean(pmf) - 761.0 / 35.0) < 1e-9);
  }

  // 7) Domaines invalides
  {
    bool thrown = false;
    try { (void)pc::core::exact_length_pmf(8, 7); } catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);
    thrown = false;
    try { (void)pc::core::exact_length_pmf(0, 25); } catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);
    // Coupure "infinie" : la taille limit + n déborderait
    thrown = false;
    try { (void)pc::core::exact_length_pmf(8, std::numeric_limits<std::size_t>::max()); }
    catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);
    thrown = false;
    try { (void)pc::core::exact_length_pmf(8, pc::core::kMaxExactDrawLimit + 1); }
    catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);
    assert(pc::core::exact_length_pmf(8, pc::core::kMaxExactDrawLimit).size()
           == pc::core::kMaxExactDrawLimit + 8);
  }

  // 8) UniformRng : reproductibilité, copie "seed-only", bornes
  {
    pc::core::UniformRng a(5), b(5);
    std::vector<std::size_t> seq;
    for (int i = 0; i < 100; ++i) {
      const std::size_t x = a.draw(8);
      assert(x == b.draw(8));
      seq.push_back(x);
    }
    pc::core::UniformRng c(a); // repart du début de la séquence
    assert(c.seed() == 5);
    for (int i = 0; i < 100; ++i) assert(c.draw(8) == seq[static_cast<std::size_t>(i)]);

    std::set<std::size_t> seen;
    std::vector<std::size_t> freq(8, 0);
    const int N = 800'000;
    for (int i = 0; i < N; ++i) {
      const std::size_t x = a.draw(8);
      assert(x < 8);
      seen.insert(x);
      ++freq[x];
    }
    assert(seen.size() == 8);
    for (std::size_t f : freq) assert(std::abs(static_cast<double>(f) / N - 0.125) < 0.003);

    bool thrown = false;
    try { (void)a.draw(0); } catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);
  }

  // 9) Graines dérivées distinctes
  {
    std::set<std::uint64_t> seeds;
    for (std::uint64_t i = 0; i < 64; ++i) seeds.insert(pc::core::derive_seed(42, i));
    assert(seeds.size() == 64);
    assert(pc::core::derive_seed(42, 0) == pc::core::derive_seed(42, 0));
  }

  std::cout << "Core (stats, theory, rng) OK.\n";
  return 0;
}
