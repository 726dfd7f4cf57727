#include <pc/core/theory.hpp>

#include <stdexcept>

namespace pc {
namespace core {

double harmonic(std::size_t n) noexcept {
  double h = 0.0;
  for (std::size_t i = 1; i <= n; ++i) {
    h += 1.0 / static_cast<double>(i);
  }
  return h;
}

double expected_draws_unbounded(std::size_t n_prizes) noexcept {
  return static_cast<double>(n_prizes) * harmonic(n_prizes);
}

std::vector<double> exact_length_pmf(std::size_t n_prizes,
                                     std::size_t random_draw_limit) {
  if (n_prizes == 0) {
    throw std::invalid_argument("exact_length_pmf: n_prizes must be > 0");
  }
  if (random_draw_limit < n_prizes) {
    throw std::invalid_argument("exact_length_pmf: random_draw_limit must be >= n_prizes");
  }
  if (random_draw_limit > kMaxExactDrawLimit) {
    throw std::invalid_argument("exact_length_pmf: random_draw_limit is too large (use n*H(n) for no cutoff)");
  }

  const double n = static_cast<double>(n_prizes);
  std::vector<double> pmf(random_draw_limit + n_prizes, 0.0);

  // dist[k] = P(k lots distincts, essai pas encore terminé)
  std::vector<double> dist(n_prizes + 1, 0.0);
  dist[0] = 1.0;

  for (std::size_t t = 1; t <= random_draw_limit; ++t) {
    std::vector<double> next(n_prizes + 1, 0.0);
    for (std::size_t k = 0; k < n_prizes; ++k) {
      if (dist[k] == 0.0) continue;
      next[k]     += dist[k] * (static_cast<double>(k) / n);
      next[k + 1] += dist[k] * (static_cast<double>(n_prizes - k) / n);
    }
    pmf[t] = next[n_prizes];   // terminé exactement au tirage t
    next[n_prizes] = 0.0;
    dist.swap(next);
  }

  // Repli déterministe : un lot manquant gagné par tirage.
  // Après au moins un tirage, k >= 1 : dist[0] est nul.
  for (std::size_t k = 1; k < n_prizes; ++k) {
    pmf[random_draw_limit + (n_prizes - k)] += dist[k];
  }
  return pmf;
}

double pmf_mean(const std::vector<double>& pmf) noexcept {
  double m = 0.0;
  for (std::size_t L = 0; L < pmf.size(); ++L) {
    m += static_cast<double>(L) * pmf[L];
  }
  return m;
}

} // namespace core
} // namespace pc
