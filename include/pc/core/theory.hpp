#pragma once
/**
 * @file theory.hpp
 * @brief Valeurs de référence fermées pour le collectionneur de coupons.
 *
 * # Collectionneur "pur"
 *    E[T] = n * H(n),  H(n) = 1 + 1/2 + ... + 1/n
 * Pour n = 8 : E[T] ≈ 21.742857.
 *
 * # Processus simulé (coupure après `random_draw_limit` tirages aléatoires)
 * Les `random_draw_limit` premiers tirages sont uniformes ; ensuite chaque
 * tirage gagne un lot manquant. La loi exacte de la longueur s'obtient par
 * une chaîne de Markov sur le nombre k de lots distincts :
 *    P(k -> k+1) = (n - k) / n,   P(k -> k) = k / n.
 * - L <= limit : P(L) = P(k atteint n exactement au tirage L).
 * - L = limit + m (1 <= m <= n-1) : P(k == n - m après `limit` tirages).
 * Pour n = 8, limit = 25 : E[L] ≈ 19.838 (la coupure raccourcit la queue).
 */

#include <cstddef>
#include <vector>

namespace pc {
namespace core {

/// @brief Plus grande coupure acceptée par exact_length_pmf.
constexpr std::size_t kMaxExactDrawLimit = 100'000;

/// @return H(n) = sum_{i=1..n} 1/i (0 si n == 0).
double harmonic(std::size_t n) noexcept;

/// @return n * H(n), espérance du collectionneur de coupons sans coupure.
double expected_draws_unbounded(std::size_t n_prizes) noexcept;

/**
 * @brief Loi exacte de la longueur d'un essai avec coupure.
 * @param n_prizes          nombre de lots (> 0).
 * @param random_draw_limit nombre de tirages aléatoires avant le repli (>= n_prizes).
 * @return pmf indexée par la longueur : pmf[L] = P(longueur == L),
 *         taille random_draw_limit + n_prizes (dernier index = longueur max).
 * @throws std::invalid_argument si n_prizes == 0, random_draw_limit < n_prizes
 *         ou random_draw_limit > kMaxExactDrawLimit (sans coupure, utiliser
 *         expected_draws_unbounded).
 */
std::vector<double> exact_length_pmf(std::size_t n_prizes,
                                     std::size_t random_draw_limit);

/// @return sum_L L * pmf[L].
double pmf_mean(const std::vector<double>& pmf) noexcept;

} // namespace core
} // namespace pc
