#include <pc/core/stats.hpp>

#include <algorithm> // std::min, std::max
#include <cmath>     // std::sqrt
#include <limits>    // std::numeric_limits

namespace pc {
namespace core {

// --- LengthStats ------------------------------------------------------------

void LengthStats::add(std::size_t length) noexcept {
  const std::uint64_t x = static_cast<std::uint64_t>(length);
  min_ = (n_ == 0) ? length : std::min(min_, length);
  max_ = std::max(max_, length);
  n_      += 1;
  sum_    += x;
  sum_sq_ += x * x;
}

void LengthStats::add(std::size_t length, std::uint64_t count) noexcept {
  if (count == 0) return;
  const std::uint64_t x = static_cast<std::uint64_t>(length);
  min_ = (n_ == 0) ? length : std::min(min_, length);
  max_ = std::max(max_, length);
  n_      += static_cast<std::size_t>(count);
  sum_    += x * count;
  sum_sq_ += x * x * count;
}

void LengthStats::merge(const LengthStats& other) noexcept {
  if (other.n_ == 0) return;
  min_ = (n_ == 0) ? other.min_ : std::min(min_, other.min_);
  max_ = std::max(max_, other.max_);
  n_      += other.n_;
  sum_    += other.sum_;
  sum_sq_ += other.sum_sq_;
}

double LengthStats::mean() const noexcept {
  if (n_ == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return static_cast<double>(sum_) / static_cast<double>(n_);
}

double LengthStats::variance() const noexcept {
  if (n_ < 2) {
    return std::numeric_limits<double>::quiet_NaN(); // politique: indéfini si n<2
  }
  // n * sum_sq - sum^2 est exact en entiers tant que les longueurs restent petites.
  const long double n   = static_cast<long double>(n_);
  const long double s   = static_cast<long double>(sum_);
  const long double ssq = static_cast<long double>(sum_sq_);
  const long double num = n * ssq - s * s;
  if (num <= 0.0L) return 0.0;
  return static_cast<double>(num / (n * (n - 1.0L)));
}

double LengthStats::std_error() const noexcept {
  if (n_ == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const double var = variance(); // NaN si n<2, propagé ici
  return std::sqrt(var / static_cast<double>(n_));
}

// --- Confidence interval 95% ------------------------------------------------

double half_width_95(double std_error) noexcept {
  // z pour 95% bilatéral sous normale
  static constexpr double Z95 = 1.959963984540054;
  return Z95 * std_error;
}

ConfidenceInterval confidence_interval_95(double mean, double std_error) noexcept {
  const double half = half_width_95(std_error);
  return { mean - half, mean + half };
}

} // namespace core
} // namespace pc
