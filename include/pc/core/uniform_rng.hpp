#pragma once
/**
 * @file uniform_rng.hpp
 * @brief Source de tirages d'index uniformes, injectable dans le simulateur.
 *
 * # DrawSource
 * Interface minimale : `draw(n)` rend un index uniforme dans [0, n).
 * Le simulateur ne connaît que cette interface, ce qui permet aux tests de
 * lui fournir une séquence scriptée.
 *
 * # UniformRng
 * Implémentation de production (PIMPL autour d'un Mersenne Twister 64 bits).
 *
 * # Reproductibilité
 * Deux instances construites avec la même graine produisent la même séquence.
 * La copie/assignation copie la graine ; l'état interne est reconstruit à
 * partir de cette graine (la copie repart donc du début de la séquence).
 *
 * # Concurrence
 * Utiliser **un RNG par thread**. Une même instance n'est pas thread-safe.
 */

#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint64_t
#include <memory>

namespace pc {
namespace core {

/// @brief Source abstraite d'index uniformes.
class DrawSource {
public:
  virtual ~DrawSource() = default;

  /// @brief Un tirage uniforme dans [0, n).
  /// @param n borne exclusive (> 0).
  virtual std::size_t draw(std::size_t n) = 0;
};

/**
 * @brief Générateur uniforme d'index, graine explicite.
 *
 * L'implémentation est cachée (PIMPL) afin de ne pas exposer <random>.
 */
class UniformRng final : public DrawSource {
public:
  /// @brief Construit avec la graine par défaut (documentée dans le .cpp).
  UniformRng();

  /// @brief Construit avec une graine explicite.
  explicit UniformRng(std::uint64_t seed);

  /// @brief Un index uniforme dans [0, n).
  /// @throws std::invalid_argument si n == 0.
  std::size_t draw(std::size_t n) override;

  /// @brief Graine utilisée pour (re)construire l'état interne.
  std::uint64_t seed() const noexcept;

  // Sémantique de copie/assignation : on copie la graine uniquement.
  UniformRng(const UniformRng&);
  UniformRng& operator=(const UniformRng&);

  UniformRng(UniformRng&&) noexcept;
  UniformRng& operator=(UniformRng&&) noexcept;

  ~UniformRng() noexcept override;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
  std::uint64_t seed_;
};

/// @brief Dérive une graine de worker à partir d'une graine maître (splitmix64).
/// @details Deux index différents donnent des flux bien séparés.
std::uint64_t derive_seed(std::uint64_t master, std::uint64_t index) noexcept;

} // namespace core
} // namespace pc
