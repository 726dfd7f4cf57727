#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateur en streaming pour des longueurs d'essai (entiers) + IC 95 %.
 *
 * - Somme et somme des carrés tenues en entiers 64 bits : la moyenne vaut
 *   exactement sum / n (pas de dérive d'arrondi entre passes ou entre threads).
 * - Variance : échantillon (diviseur n-1).
 * - Erreur standard : sqrt(variance / n).
 * - IC 95 % : mean ± z * std_error, avec z ≈ 1.9599639845 (normale).
 * - `merge` combine deux accumulateurs (réduction parallèle).
 *
 * Politique aux petits n :
 *   - n == 0 : mean()=NaN, variance()=NaN, std_error()=NaN, min()/max() = 0.
 *   - n == 1 : variance()=NaN (n-1 = 0), std_error()=NaN.
 */

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t

namespace pc {
namespace core {

class LengthStats {
public:
  LengthStats() noexcept = default;

  /// @brief Ajoute une longueur observée.
  void add(std::size_t length) noexcept;

  /// @brief Ajoute `count` observations de la même longueur, en O(1).
  void add(std::size_t length, std::uint64_t count) noexcept;

  /// @brief Ajoute les observations d'un autre accumulateur.
  void merge(const LengthStats& other) noexcept;

  std::size_t count() const noexcept { return n_; }
  std::uint64_t sum() const noexcept { return sum_; }
  std::size_t min() const noexcept { return n_ ? min_ : 0; }
  std::size_t max() const noexcept { return max_; }

  /// @return sum / n (NaN si n == 0).
  double mean() const noexcept;

  /// @return Variance d'échantillon (NaN si n < 2).
  [[nodiscard]] double variance() const noexcept;

  /// @return Erreur standard de la moyenne.
  [[nodiscard]] double std_error() const noexcept;

private:
  std::size_t n_{0};
  std::uint64_t sum_{0};
  std::uint64_t sum_sq_{0};
  std::size_t min_{0};
  std::size_t max_{0};
};

/// @brief Intervalle de confiance 95 % pour la moyenne (approx. normale).
struct ConfidenceInterval {
  double low;
  double high;
};

/// @brief Demi-largeur à 95 % : z * std_error.
[[nodiscard]] double half_width_95(double std_error) noexcept;

/// @brief Calcule mean ± z * std_error (z ≈ 1.9599639845).
[[nodiscard]] ConfidenceInterval confidence_interval_95(double mean,
                                                        double std_error) noexcept;

} // namespace core
} // namespace pc
