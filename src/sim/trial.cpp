#include <pc/sim/trial.hpp>

#include <stdexcept> // std::logic_error

namespace pc {
namespace sim {

using pc::core::Prize;
using pc::core::kNumPrizes;

namespace {
constexpr std::uint8_t FULL_MASK = static_cast<std::uint8_t>((1u << kNumPrizes) - 1u);

inline std::uint8_t bit_of(Prize p) noexcept {
  return static_cast<std::uint8_t>(1u << pc::core::to_index(p));
}

// Un tirage selon la politique : aléatoire avant la coupure, repli ensuite.
inline Prize next_prize(pc::core::DrawSource& rng, const EarnedSet& earned,
                        std::size_t drawn, std::size_t limit) {
  if (drawn < limit) {
    return sample_outcome(rng);
  }
  return earned.lowest_missing();
}
} // anonymous namespace

// --- EarnedSet ---------------------------------------------------------------

bool EarnedSet::mark(Prize p) noexcept {
  const std::uint8_t b = bit_of(p);
  const bool fresh = (bits_ & b) == 0;
  bits_ = static_cast<std::uint8_t>(bits_ | b);
  return fresh;
}

bool EarnedSet::contains(Prize p) const noexcept {
  return (bits_ & bit_of(p)) != 0;
}

std::size_t EarnedSet::size() const noexcept {
  std::size_t n = 0;
  for (std::uint8_t b = bits_; b != 0; b = static_cast<std::uint8_t>(b & (b - 1))) ++n;
  return n;
}

bool EarnedSet::complete() const noexcept {
  return bits_ == FULL_MASK;
}

Prize EarnedSet::lowest_missing() const {
  for (std::size_t i = 0; i < kNumPrizes; ++i) {
    const Prize p = pc::core::prize_from_index(i);
    if (!contains(p)) return p;
  }
  // La boucle d'essai s'arrête dès que l'ensemble est complet.
  throw std::logic_error("EarnedSet: fallback draw requested with every prize earned");
}

// --- Tirages -----------------------------------------------------------------

Prize sample_outcome(pc::core::DrawSource& rng) {
  return pc::core::prize_from_index(rng.draw(kNumPrizes));
}

TrialResult run_trial(pc::core::DrawSource& rng, const TrialOptions& opts) {
  TrialResult results;
  results.reserve(kMaxTrialLength);
  EarnedSet earned;

  while (!earned.complete()) {
    const Prize p = next_prize(rng, earned, results.size(), opts.random_draw_limit);
    earned.mark(p);
    results.push_back(p);
  }
  return results;
}

std::size_t trial_length(pc::core::DrawSource& rng, const TrialOptions& opts) {
  EarnedSet earned;
  std::size_t drawn = 0;

  while (!earned.complete()) {
    earned.mark(next_prize(rng, earned, drawn, opts.random_draw_limit));
    ++drawn;
  }
  return drawn;
}

} // namespace sim
} // namespace pc
