#pragma once
/**
 * @file outcome.hpp
 * @brief Les 8 lots (issues) possibles d'un tirage.
 *
 * # Contenu
 * - `Prize` : énumération fermée de 8 valeurs mutuellement exclusives.
 * - Conversion vers/depuis un index dense dans [0, 8).
 *
 * # Domaine valide
 * - Index dans [0, kNumPrizes). Hors domaine ⇒ std::out_of_range.
 *
 * L'ordre des valeurs n'a pas de sens métier, sauf pour le repli déterministe
 * du simulateur qui choisit le plus petit index non encore gagné.
 */

#include <cstddef>   // std::size_t
#include <stdexcept> // std::out_of_range
#include <string>

namespace pc {
namespace core {

/// @brief Nombre de lots distincts.
constexpr std::size_t kNumPrizes = 8;

/// @brief Un lot tiré (valeur immuable).
enum class Prize : unsigned char {
  First = 0,
  Second,
  Third,
  Fourth,
  Fifth,
  Sixth,
  Seventh,
  Eighth
};

/// @return Index dense du lot, dans [0, 8).
constexpr std::size_t to_index(Prize p) noexcept {
  return static_cast<std::size_t>(p);
}

/// @brief Lot correspondant à un index dense.
/// @throws std::out_of_range si index >= 8.
inline Prize prize_from_index(std::size_t index) {
  if (index >= kNumPrizes) {
    throw std::out_of_range("prize_from_index: can only convert 0..7 to Prize");
  }
  return static_cast<Prize>(index);
}

/// @return Libellé lisible ("prize 1" … "prize 8").
inline std::string to_string(Prize p) {
  return "prize " + std::to_string(to_index(p) + 1);
}

} // namespace core
} // namespace pc
