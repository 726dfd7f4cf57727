#include <pc/config/sim_config.hpp>
#include <pc/core/outcome.hpp>
#include <pc/core/stats.hpp>
#include <pc/core/theory.hpp>
#include <pc/io/histogram_csv.hpp>
#include <pc/sim/batch.hpp>

#include <algorithm>
#include <cstdint>
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

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " N seed [--threads T] [--batch B] [--csv FILE] [--no-cutoff] [--quiet]\n"
            << "Reference values for N: 100 and 1000000.\n";
}

// Histogramme texte sur les seaux d'affichage [8, 35).
static void print_text_histogram(const pc::sim::Histogram& h) {
  constexpr int BAR_WIDTH = 50;
  const std::uint64_t peak = std::max<std::uint64_t>(1, h.max_count());
  const auto counts = h.bucket_counts(pc::config::kPlotFirstBucket, pc::config::kPlotLastBucket);

  for (std::size_t i = 0; i < counts.size(); ++i) {
    const int w = static_cast<int>((counts[i] * BAR_WIDTH + peak / 2) / peak);
    std::cout << std::setw(3) << (pc::config::kPlotFirstBucket + i) << " | "
              << std::string(static_cast<std::size_t>(w), '#')
              << ' ' << counts[i] << "\n";
  }
  // Longueurs hors seaux (possibles seulement sans coupure)
  std::uint64_t beyond = 0;
  for (const auto& kv : h) {
    if (kv.first >= pc::config::kPlotLastBucket) beyond += kv.second;
  }
  if (beyond > 0) {
    std::cout << ">=" << pc::config::kPlotLastBucket << " | " << beyond << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    print_usage(argv[0]);
    return 1;
  }

  std::size_t n_trials;
  unsigned long long seed;
  try {
    n_trials = static_cast<std::size_t>(parse_unsigned(argv[1]));
    seed     = parse_unsigned(argv[2]);
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  // Flags optionnels
  std::size_t n_threads = 1;
  std::size_t batch = 100'000;
  std::size_t limit = pc::sim::kRandomDrawLimit;
  bool quiet = false;
  std::string csv_file;

  try {
    for (int i = 3; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--threads" && i + 1 < argc) {
        n_threads = static_cast<std::size_t>(parse_unsigned(argv[++i]));
      } else if (arg == "--batch" && i + 1 < argc) {
        batch = static_cast<std::size_t>(parse_unsigned(argv[++i]));
      } else if (arg == "--csv" && i + 1 < argc) {
        csv_file = argv[++i];
      } else if (arg.rfind("--csv=", 0) == 0) {
        csv_file = arg.substr(6);
      } else if (arg == "--no-cutoff") {
        limit = pc::sim::kNoDrawLimit;
      } else if (arg == "--quiet") {
        quiet = true;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    pc::config::SimConfig cfg(n_trials, batch, seed, n_threads, limit);
    pc::sim::BatchRunner runner(cfg);

    if (!quiet) {
      runner.set_progress_callback([&](const pc::sim::BatchProgress& p) {
        std::cerr << "[progress] " << p.n_done << "/" << cfg.trial_count
                  << " mean=" << std::fixed << std::setprecision(4) << p.mean
                  << " +/- " << p.half_width_95 << "\n";
      });
    }

    const auto res = runner.run();
    const double se = res.stats.std_error();
    const auto ci = pc::core::confidence_interval_95(res.mean_trial_length, se);

    const double unbounded = pc::core::expected_draws_unbounded(pc::core::kNumPrizes);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "Average number of rolls to earn all prizes: " << res.mean_trial_length << "\n"
              << "trials        : " << res.n_trials     << "\n"
              << "std_error     : " << se               << "\n"
              << "ci_low        : " << ci.low           << "\n"
              << "ci_high       : " << ci.high          << "\n"
              << "min_length    : " << res.stats.min()  << "\n"
              << "max_length    : " << res.stats.max()  << "\n"
              << "elapsed_ms    : " << res.elapsed_ms   << "\n"
              << "threads       : " << cfg.n_threads    << "\n"
              << "cutoff        : ";
    if (limit == pc::sim::kNoDrawLimit) {
      std::cout << "none\n";
    } else {
      const auto pmf = pc::core::exact_length_pmf(pc::core::kNumPrizes, limit);
      std::cout << limit << "\n"
                << "exact_mean    : " << pc::core::pmf_mean(pmf) << "\n";
    }
    std::cout << "n*H(n)        : " << unbounded << "\n\n";

    print_text_histogram(res.histogram);

    if (!csv_file.empty()) {
      try {
        pc::io::write_histogram_csv(csv_file, res);
      } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
      }
      std::cout << "histogram written to: " << csv_file << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }

  return 0;
}
