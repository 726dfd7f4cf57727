#pragma once
/**
 * @file batch.hpp
 * @brief Lot d'essais indépendants : longueur moyenne + histogramme.
 *
 * # run_batch
 * Fonction de référence : joue `trial_count` essais sur la source fournie,
 * puis réduit les longueurs via `summarize` (moyenne = somme / n exacte,
 * histogramme longueur → compte).
 *
 * # BatchRunner
 * Orchestrateur utilisé par les front-ends (CLI, GUI) :
 * - RNG construit à partir de la graine de la config (reproductible).
 * - Simulation par lots de `batch_size`, progression après chaque lot.
 * - Arrêt coopératif (`request_stop`, appelable depuis un autre thread).
 * - `n_threads > 1` : partage des essais entre workers (les `rem` premiers
 *   font un essai de plus), un RNG par worker dérivé de la graine maître,
 *   histogrammes/stats locaux fusionnés après `join`.
 *
 * # Erreurs
 * - trial_count == 0 / liste vide ⇒ std::invalid_argument (aucune division).
 */

#include <atomic>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include <pc/config/sim_config.hpp>
#include <pc/core/stats.hpp>
#include <pc/core/uniform_rng.hpp>
#include <pc/sim/histogram.hpp>
#include <pc/sim/trial.hpp>

namespace pc {
namespace sim {

/// @brief Résultat d'un lot, remis aux composants de rendu.
struct BatchSummary {
  double mean_trial_length{0.0};  ///< sum(longueurs) / n_trials.
  Histogram histogram;            ///< longueur → nombre d'essais.
  pc::core::LengthStats stats;    ///< min, max, variance, erreur standard.
  std::size_t n_trials{0};        ///< Essais effectivement simulés.
  long long elapsed_ms{0};        ///< Durée de la simulation.
  bool completed{true};           ///< false si arrêté avant trial_count.
};

/**
 * @brief Réduit des longueurs d'essai en moyenne + histogramme.
 * @throws std::invalid_argument si `lengths` est vide.
 */
BatchSummary summarize(const std::vector<std::size_t>& lengths);

/**
 * @brief Résumé reconstruit depuis un histogramme (session rechargée).
 *
 * Coût proportionnel au nombre de clés, pas au nombre d'essais.
 * @throws std::invalid_argument si l'histogramme est vide.
 */
BatchSummary summarize(const Histogram& hist);

/**
 * @brief Joue `trial_count` essais indépendants et les résume.
 * @param trial_count nombre d'essais (≥ 1).
 * @param rng         source de tirages partagée par les essais.
 * @param opts        politique de tirage (coupure à 25 par défaut).
 * @throws std::invalid_argument si trial_count == 0.
 */
BatchSummary run_batch(std::size_t trial_count,
                       pc::core::DrawSource& rng,
                       const TrialOptions& opts = TrialOptions{});

/// @brief Un point de progression (après un lot).
struct BatchProgress {
  std::size_t n_done;     ///< Essais cumulés.
  double      mean;       ///< Moyenne courante.
  double      half_width_95; ///< Demi-largeur de l'IC 95 % courant.
};

class BatchRunner {
public:
  using ProgressCallback = std::function<void(const BatchProgress&)>;

  /// @throws std::invalid_argument si la configuration est invalide.
  explicit BatchRunner(pc::config::SimConfig cfg);

  /// @brief Rappel appelé sur le thread de `run()` après chaque lot.
  void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }

  /// @brief Demande d'arrêt asynchrone (pris en compte entre deux lots).
  void request_stop() noexcept { stop_.store(true, std::memory_order_relaxed); }

  /**
   * @brief Lance la simulation.
   * @return Résumé ; `completed == false` si arrêté en cours de route.
   * @throws std::invalid_argument si arrêté avant le premier essai.
   */
  BatchSummary run();

  const pc::config::SimConfig& config() const noexcept { return cfg_; }

private:
  BatchSummary run_sequential_();
  BatchSummary run_parallel_();

  pc::config::SimConfig cfg_;
  ProgressCallback progress_;
  std::atomic<bool> stop_{false};
};

} // namespace sim
} // namespace pc
