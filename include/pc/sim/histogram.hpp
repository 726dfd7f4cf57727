#pragma once
/**
 * @file histogram.hpp
 * @brief Histogramme longueur d'essai → nombre d'essais.
 *
 * - Clés uniques, comptes > 0 (une clé absente vaut 0).
 * - Itération par longueur croissante (std::map) : un rendu peut la
 *   parcourir directement.
 * - `merge` est additif, commutatif et associatif (réduction entre workers).
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace pc {
namespace sim {

/// @brief Plus grand compte accepté par bin_from_real (2^40).
constexpr std::uint64_t kMaxBinCount = std::uint64_t{1} << 40;

/**
 * @brief Valide un couple (longueur, compte) lu sous forme réelle (JSON).
 *
 * Refuse les valeurs non finies ou non entières, une longueur hors
 * [min_length, max_length] et un compte hors [1, kMaxBinCount].
 * @return true et remplit `length_out` / `count_out` si le couple est valide.
 */
bool bin_from_real(double length, double count,
                   std::size_t min_length, std::size_t max_length,
                   std::size_t& length_out, std::uint64_t& count_out) noexcept;

class Histogram {
public:
  using Map = std::map<std::size_t, std::uint64_t>;
  using const_iterator = Map::const_iterator;

  /// @brief Ajoute `count` essais de longueur `length`.
  void add(std::size_t length, std::uint64_t count = 1);

  /// @brief Ajoute tous les comptes d'un autre histogramme.
  void merge(const Histogram& other);

  /// @return Nombre d'essais de longueur `length` (0 si absent).
  std::uint64_t count(std::size_t length) const noexcept;

  /// @return Somme des comptes (= nombre d'essais).
  std::uint64_t total() const noexcept;

  /// @return Plus grand compte (0 si vide).
  std::uint64_t max_count() const noexcept;

  /// @return Plus petite / plus grande longueur présente (0 si vide).
  std::size_t min_length() const noexcept;
  std::size_t max_length() const noexcept;

  std::size_t size() const noexcept { return bins_.size(); }
  bool empty() const noexcept { return bins_.empty(); }

  /**
   * @brief Comptes denses sur [lo, hi) pour un rendu à seaux fixes.
   * @return vecteur de taille hi - lo (vide si hi <= lo) ; out[i] = count(lo + i).
   */
  std::vector<std::uint64_t> bucket_counts(std::size_t lo, std::size_t hi) const;

  const Map& bins() const noexcept { return bins_; }
  const_iterator begin() const noexcept { return bins_.begin(); }
  const_iterator end() const noexcept { return bins_.end(); }

  bool operator==(const Histogram& other) const { return bins_ == other.bins_; }
  bool operator!=(const Histogram& other) const { return !(*this == other); }

private:
  Map bins_;
};

} // namespace sim
} // namespace pc
