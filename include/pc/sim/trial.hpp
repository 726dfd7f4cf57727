#pragma once
/**
 * @file trial.hpp
 * @brief Un essai du collectionneur : tirer des lots jusqu'à les avoir tous.
 *
 * # Politique de tirage
 * - Tant que la séquence compte moins de `random_draw_limit` (25) tirages,
 *   le lot est tiré uniformément parmi les 8, sans regarder les lots déjà
 *   gagnés (un doublon consomme un tirage sans progrès).
 * - Une fois 25 tirages faits, plus de hasard : on prend le lot non gagné de
 *   plus petit index. Chaque tirage suivant gagne donc un nouveau lot.
 *
 * # Bornes
 * - Longueur min : 8. Longueur max : 25 + 7 = 32.
 * - `kNoDrawLimit` désactive le repli (collectionneur pur, longueur non bornée).
 *
 * # Tests recommandés
 * - Source scriptée qui bloque sur un lot manquant au-delà de 25 tirages :
 *   le repli doit fournir le plus petit index manquant à chaque tirage.
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include <pc/core/outcome.hpp>
#include <pc/core/uniform_rng.hpp>

namespace pc {
namespace sim {

/// @brief Nombre de tirages aléatoires avant le repli déterministe.
constexpr std::size_t kRandomDrawLimit = 25;

/// @brief Valeur de `random_draw_limit` qui désactive le repli.
constexpr std::size_t kNoDrawLimit = std::numeric_limits<std::size_t>::max();

/// @brief Longueur minimale d'un essai (tous les lots distincts d'affilée).
constexpr std::size_t kMinTrialLength = pc::core::kNumPrizes;

/// @brief Longueur maximale d'un essai avec la coupure par défaut.
constexpr std::size_t kMaxTrialLength = kRandomDrawLimit + pc::core::kNumPrizes - 1;

/// @brief Séquence ordonnée des lots tirés pendant un essai.
using TrialResult = std::vector<pc::core::Prize>;

/// @brief Options d'un essai.
struct TrialOptions {
  std::size_t random_draw_limit = kRandomDrawLimit; ///< kNoDrawLimit ⇒ pas de repli.
};

/**
 * @brief Ensemble des lots déjà gagnés pendant un essai.
 *
 * Un bit posé n'est jamais effacé.
 */
class EarnedSet {
public:
  /// @brief Marque un lot comme gagné (idempotent).
  /// @return true si le lot était nouveau.
  bool mark(pc::core::Prize p) noexcept;

  bool contains(pc::core::Prize p) const noexcept;

  /// @return Nombre de lots distincts gagnés.
  std::size_t size() const noexcept;

  /// @return true quand les 8 lots sont gagnés.
  bool complete() const noexcept;

  /// @brief Plus petit lot non gagné.
  /// @throws std::logic_error si l'ensemble est complet.
  pc::core::Prize lowest_missing() const;

private:
  std::uint8_t bits_{0};
};

/// @brief Tire un lot uniformément parmi les 8.
pc::core::Prize sample_outcome(pc::core::DrawSource& rng);

/**
 * @brief Joue un essai complet.
 * @param rng  source de tirages (consommée ; aucune autre entropie).
 * @param opts coupure du tirage aléatoire (25 par défaut).
 * @return Séquence des lots tirés, dans l'ordre ; se termine exactement quand
 *         les 8 lots sont apparus.
 */
TrialResult run_trial(pc::core::DrawSource& rng, const TrialOptions& opts = TrialOptions{});

/**
 * @brief Même algorithme que run_trial, sans matérialiser la séquence.
 * @return Longueur de l'essai ; consomme exactement les mêmes tirages.
 */
std::size_t trial_length(pc::core::DrawSource& rng, const TrialOptions& opts = TrialOptions{});

} // namespace sim
} // namespace pc
