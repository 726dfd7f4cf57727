#pragma once
/**
 * @file sim_config.hpp
 * @brief Configuration standard d'un run de simulation.
 *
 * # Contenu
 * - trial_count       : nombre d'essais à simuler (≥ 1).
 * - batch_size        : essais par lot entre deux rapports de progression (≥ 1).
 * - seed              : graine maître du RNG.
 * - n_threads         : nombre de workers (≥ 1). 1 = séquentiel.
 * - random_draw_limit : tirages aléatoires avant le repli déterministe
 *                       (25 ; ≥ 8 ; kNoDrawLimit ⇒ collectionneur pur).
 *
 * # Reproductibilité
 * Même (seed, n_threads, batch_size) ⇒ même histogramme.
 */

#include <cstddef>   // std::size_t
#include <cstdint>   // std::uint64_t
#include <stdexcept> // std::invalid_argument

#include <pc/sim/trial.hpp> // kRandomDrawLimit

namespace pc {
namespace config {

/// @brief Bornes d'affichage de l'histogramme (seaux [lo, hi)).
constexpr std::size_t kPlotFirstBucket = 8;
constexpr std::size_t kPlotLastBucket  = 35;

struct SimConfig {
  std::size_t   trial_count;       ///< Nombre d'essais.
  std::size_t   batch_size;        ///< Essais par lot (progression / arrêt).
  std::uint64_t seed;              ///< Graine maître.
  std::size_t   n_threads;         ///< Workers (1 = séquentiel).
  std::size_t   random_draw_limit; ///< Coupure du tirage aléatoire.

  SimConfig(std::size_t trial_count = 1'000'000,
            std::size_t batch_size = 100'000,
            std::uint64_t seed = 42ULL,
            std::size_t n_threads = 1,
            std::size_t random_draw_limit = pc::sim::kRandomDrawLimit) noexcept
      : trial_count(trial_count),
        batch_size(batch_size),
        seed(seed),
        n_threads(n_threads),
        random_draw_limit(random_draw_limit) {}

  /// @throws std::invalid_argument si un champ est hors domaine.
  void validate() const {
    if (trial_count == 0) {
      throw std::invalid_argument("SimConfig: trial_count must be >= 1");
    }
    if (batch_size == 0) {
      throw std::invalid_argument("SimConfig: batch_size must be >= 1");
    }
    if (n_threads == 0) {
      throw std::invalid_argument("SimConfig: n_threads must be >= 1");
    }
    if (random_draw_limit < pc::core::kNumPrizes) {
      throw std::invalid_argument("SimConfig: random_draw_limit must be >= 8");
    }
  }
};

} // namespace config
} // namespace pc
