#include <pc/core/outcome.hpp>
#include <pc/core/theory.hpp>
#include <pc/core/uniform_rng.hpp>
#include <pc/sim/batch.hpp>

#include <cmath>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

// Entier non signé strict : refuse "-1", "+3", "12x" (stoull accepterait "-1").
static unsigned long long parse_unsigned(const std::string& s) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
    throw std::invalid_argument("not an unsigned integer: " + s);
  }
  std::size_t pos = 0;
  const unsigned long long v = std::stoull(s, &pos);
  if (pos != s.size()) {
    throw std::invalid_argument("not an unsigned integer: " + s);
  }
  return v;
}

// Loi exacte de la longueur d'essai (coupure donnée), et comparaison
// optionnelle avec un lot simulé.
int main(int argc, char** argv) {
  if (argc != 2 && argc != 4) {
    std::cerr << "Usage: " << argv[0] << " cutoff [N seed]\n";
    return 1;
  }

  std::size_t cutoff = 0;
  std::size_t N = 0;
  unsigned long long seed = 0;
  try {
    cutoff = static_cast<std::size_t>(parse_unsigned(argv[1]));
    if (argc == 4) {
      N    = static_cast<std::size_t>(parse_unsigned(argv[2]));
      seed = parse_unsigned(argv[3]);
    }
  } catch (const std::exception&) {
    std::cerr << "Usage: " << argv[0] << " cutoff [N seed]\n";
    return 1;
  }

  try {
    const auto pmf = pc::core::exact_length_pmf(pc::core::kNumPrizes, cutoff);
    const double mean_th = pc::core::pmf_mean(pmf);

    pc::sim::BatchSummary res;
    const bool with_mc = (N > 0);
    if (with_mc) {
      pc::core::UniformRng rng(seed);
      res = pc::sim::run_batch(N, rng, pc::sim::TrialOptions{cutoff});
    }

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "n*H(n)=" << pc::core::expected_draws_unbounded(pc::core::kNumPrizes)
              << " exact_mean=" << mean_th << "\n";
    if (with_mc) {
      std::cout << "mean_emp=" << res.mean_trial_length
                << " rel_err=" << std::abs(res.mean_trial_length - mean_th) / mean_th << "\n";
    }

    std::cout << "length,p_exact" << (with_mc ? ",p_emp" : "") << "\n";
    for (std::size_t L = 0; L < pmf.size(); ++L) {
      if (pmf[L] == 0.0) continue;
      std::cout << L << ',' << pmf[L];
      if (with_mc) {
        std::cout << ',' << static_cast<double>(res.histogram.count(L)) / static_cast<double>(res.n_trials);
      }
      std::cout << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
