#include <pc/sim/histogram.hpp>

#include <algorithm> // std::max
#include <cmath>     // std::isfinite, std::floor

namespace pc {
namespace sim {

void Histogram::add(std::size_t length, std::uint64_t count) {
  if (count == 0) return; // pas de clé à compte nul
  bins_[length] += count;
}

void Histogram::merge(const Histogram& other) {
  for (const auto& kv : other.bins_) {
    bins_[kv.first] += kv.second;
  }
}

std::uint64_t Histogram::count(std::size_t length) const noexcept {
  const auto it = bins_.find(length);
  return it == bins_.end() ? 0 : it->second;
}

std::uint64_t Histogram::total() const noexcept {
  std::uint64_t t = 0;
  for (const auto& kv : bins_) t += kv.second;
  return t;
}

std::uint64_t Histogram::max_count() const noexcept {
  std::uint64_t m = 0;
  for (const auto& kv : bins_) m = std::max(m, kv.second);
  return m;
}

std::size_t Histogram::min_length() const noexcept {
  return bins_.empty() ? 0 : bins_.begin()->first;
}

std::size_t Histogram::max_length() const noexcept {
  return bins_.empty() ? 0 : bins_.rbegin()->first;
}

bool bin_from_real(double length, double count,
                   std::size_t min_length, std::size_t max_length,
                   std::size_t& length_out, std::uint64_t& count_out) noexcept {
  if (!std::isfinite(length) || !std::isfinite(count)) return false;
  if (std::floor(length) != length || std::floor(count) != count) return false;
  // bornes testées en double avant toute conversion
  if (length < static_cast<double>(min_length) || length > static_cast<double>(max_length)) return false;
  if (count < 1.0 || count > static_cast<double>(kMaxBinCount)) return false;
  length_out = static_cast<std::size_t>(length);
  count_out  = static_cast<std::uint64_t>(count);
  return true;
}

std::vector<std::uint64_t> Histogram::bucket_counts(std::size_t lo, std::size_t hi) const {
  if (hi <= lo) return {};
  std::vector<std::uint64_t> out(hi - lo, 0);
  for (auto it = bins_.lower_bound(lo); it != bins_.end() && it->first < hi; ++it) {
    out[it->first - lo] = it->second;
  }
  return out;
}

} // namespace sim
} // namespace pc
