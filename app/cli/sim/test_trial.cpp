#include <pc/core/outcome.hpp>
#include <pc/core/uniform_rng.hpp>
#include <pc/sim/trial.hpp>

#include <cassert>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

using pc::core::Prize;

// Source scriptée : rejoue une liste d'index, compte les tirages consommés.
class ScriptedSource : public pc::core::DrawSource {
public:
  explicit ScriptedSource(std::vector<std::size_t> seq) : seq_(std::move(seq)) {}

  std::size_t draw(std::size_t n) override {
    assert(n == pc::core::kNumPrizes);
    if (pos_ >= seq_.size()) throw std::out_of_range("ScriptedSource exhausted");
    return seq_[pos_++];
  }
  std::size_t consumed() const { return pos_; }

private:
  std::vector<std::size_t> seq_;
  std::size_t pos_ = 0;
};

static std::vector<std::size_t> repeat(std::size_t v, std::size_t n) {
  return std::vector<std::size_t>(n, v);
}

static void check_trial_shape(const pc::sim::TrialResult& t) {
  assert(t.size() >= pc::sim::kMinTrialLength);
  assert(t.size() <= pc::sim::kMaxTrialLength);

  pc::sim::EarnedSet earned;
  for (std::size_t i = 0; i < t.size(); ++i) {
    const bool fresh = earned.mark(t[i]);
    if (i >= pc::sim::kRandomDrawLimit) {
      // Phase déterministe : chaque tirage gagne un nouveau lot.
      assert(fresh);
    }
    // L'essai ne continue jamais après avoir tout gagné.
    if (i + 1 < t.size()) assert(!earned.complete());
  }
  assert(earned.complete());
  assert(earned.size() == pc::core::kNumPrizes);
}

int main() {
  // 0) Conversions index <-> lot
  for (std::size_t i = 0; i < pc::core::kNumPrizes; ++i) {
    assert(pc::core::to_index(pc::core::prize_from_index(i)) == i);
  }
  assert(pc::core::to_string(Prize::First) == "prize 1");
  assert(pc::core::to_string(Prize::Eighth) == "prize 8");
  {
    bool thrown = false;
    try { (void)pc::core::prize_from_index(8); } catch (const std::out_of_range&) { thrown = true; }
    assert(thrown);
  }

  // 1) sample_outcome lit exactement un index
  {
    ScriptedSource src({5});
    assert(pc::sim::sample_outcome(src) == Prize::Sixth);
    assert(src.consumed() == 1);
  }

  // 2) Huit lots distincts d'affilée ⇒ longueur minimale
  {
    ScriptedSource src({0, 1, 2, 3, 4, 5, 6, 7});
    const auto t = pc::sim::run_trial(src);
    assert(t.size() == 8);
    for (std::size_t i = 0; i < 8; ++i) assert(pc::core::to_index(t[i]) == i);
    assert(src.consumed() == 8);
  }

  // 3) Blocage total sur le lot 1 : 25 tirages aléatoires puis repli 2..8
  {
    ScriptedSource src(repeat(0, 25));
    const auto t = pc::sim::run_trial(src);
    assert(src.consumed() == 25);            // plus aucun tirage après la coupure
    assert(t.size() == pc::sim::kMaxTrialLength);
    for (std::size_t i = 0; i < 25; ++i) assert(t[i] == Prize::First);
    for (std::size_t i = 25; i < 32; ++i) {
      assert(pc::core::to_index(t[i]) == i - 24); // plus petit index manquant
    }
    check_trial_shape(t);
  }

  // 4) Un seul lot manquant (index 3) au-delà de 25 tirages
  {
    std::vector<std::size_t> seq{0, 1, 2, 4, 5, 6, 7};
    const auto pad = repeat(7, 25 - seq.size());
    seq.insert(seq.end(), pad.begin(), pad.end());
    ScriptedSource src(seq);
    const auto t = pc::sim::run_trial(src);
    assert(src.consumed() == 25);
    assert(t.size() == 26);
    assert(t.back() == Prize::Fourth);
    check_trial_shape(t);
  }

  // 5) Deux lots manquants (1 et 6) : le repli les donne dans l'ordre d'index
  {
    std::vector<std::size_t> seq{0, 2, 3, 4, 5, 7};
    const auto pad = repeat(2, 25 - seq.size());
    seq.insert(seq.end(), pad.begin(), pad.end());
    ScriptedSource src(seq);
    const auto t = pc::sim::run_trial(src);
    assert(t.size() == 27);
    assert(t[25] == Prize::Second);
    assert(t[26] == Prize::Seventh);
  }

  // 6) Dernier lot obtenu exactement au 25e tirage : pas de repli
  {
    std::vector<std::size_t> seq = repeat(0, 18);
    for (std::size_t i = 1; i < 8; ++i) seq.push_back(i);
    assert(seq.size() == 25);
    ScriptedSource src(seq);
    const auto t = pc::sim::run_trial(src);
    assert(t.size() == 25);
    assert(src.consumed() == 25);
    assert(t.back() == Prize::Eighth);
  }

  // 7) Sans coupure : collectionneur pur, longueur non bornée par 32
  {
    std::vector<std::size_t> seq = repeat(0, 40);
    for (std::size_t i = 1; i < 8; ++i) seq.push_back(i);
    ScriptedSource src(seq);
    const auto t = pc::sim::run_trial(src, pc::sim::TrialOptions{pc::sim::kNoDrawLimit});
    assert(t.size() == 47);
    assert(src.consumed() == 47);
  }

  // 8) trial_length suit la même séquence de tirages que run_trial
  {
    pc::core::UniformRng a(2024), b(2024);
    for (int i = 0; i < 2000; ++i) {
      const auto t = pc::sim::run_trial(a);
      assert(pc::sim::trial_length(b) == t.size());
    }
  }

  // 9) Propriétés sur des essais aléatoires
  {
    pc::core::UniformRng rng(7);
    std::size_t hit_cutoff = 0;
    for (int i = 0; i < 20000; ++i) {
      const auto t = pc::sim::run_trial(rng);
      check_trial_shape(t);
      if (t.size() > pc::sim::kRandomDrawLimit) ++hit_cutoff;
    }
    // ~26 % des essais passent par le repli avec 8 lots et une coupure à 25.
    assert(hit_cutoff > 4000 && hit_cutoff < 5800);
  }

  // 10) EarnedSet : repli demandé alors que tout est gagné ⇒ logic_error
  {
    pc::sim::EarnedSet s;
    assert(s.lowest_missing() == Prize::First);
    for (std::size_t i = 0; i < 8; ++i) s.mark(pc::core::prize_from_index(i));
    assert(!s.mark(Prize::Third)); // idempotent
    assert(s.complete());
    bool thrown = false;
    try { (void)s.lowest_missing(); } catch (const std::logic_error&) { thrown = true; }
    assert(thrown);
  }

  std::cout << "Trial simulator OK.\n";
  return 0;
}
