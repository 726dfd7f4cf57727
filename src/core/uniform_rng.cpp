#include <pc/core/uniform_rng.hpp>

#include <random>     // std::mt19937_64, std::uniform_int_distribution
#include <memory>     // std::make_unique
#include <stdexcept>  // std::invalid_argument

namespace pc {
namespace core {

namespace {
// Graine par défaut : constante "golden ratio" de Knuth.
constexpr std::uint64_t DEFAULT_SEED = 0x9E3779B97F4A7C15ULL;
} // anonymous namespace

// --- PIMPL -------------------------------------------------------------------

struct UniformRng::Impl {
  std::mt19937_64 eng;
};

// --- Ctors / Dtors -----------------------------------------------------------

UniformRng::UniformRng()
    : pimpl_(std::make_unique<Impl>()), seed_(DEFAULT_SEED) {
  pimpl_->eng.seed(seed_);
}

UniformRng::UniformRng(std::uint64_t seed)
    : pimpl_(std::make_unique<Impl>()), seed_(seed) {
  pimpl_->eng.seed(seed_);
}

UniformRng::UniformRng(const UniformRng& other)
    : DrawSource(), pimpl_(std::make_unique<Impl>()), seed_(other.seed_) {
  pimpl_->eng.seed(seed_);
}

UniformRng& UniformRng::operator=(const UniformRng& other) {
  if (this != &other) {
    seed_ = other.seed_;
    pimpl_ = std::make_unique<Impl>();
    pimpl_->eng.seed(seed_);
  }
  return *this;
}

UniformRng::UniformRng(UniformRng&& other) noexcept
    : DrawSource(), pimpl_(std::move(other.pimpl_)), seed_(other.seed_) {}

UniformRng& UniformRng::operator=(UniformRng&& other) noexcept {
  if (this != &other) {
    pimpl_ = std::move(other.pimpl_);
    seed_  = other.seed_;
  }
  return *this;
}

UniformRng::~UniformRng() noexcept = default;

// --- API ---------------------------------------------------------------------

std::uint64_t UniformRng::seed() const noexcept {
  return seed_;
}

std::size_t UniformRng::draw(std::size_t n) {
  if (n == 0) {
    throw std::invalid_argument("UniformRng: draw bound must be > 0");
  }
  std::uniform_int_distribution<std::size_t> dist(0, n - 1);
  return dist(pimpl_->eng);
}

std::uint64_t derive_seed(std::uint64_t master, std::uint64_t index) noexcept {
  // splitmix64 sur (master + (index+1) * gamma)
  std::uint64_t z = master + (index + 1) * 0x9E3779B97F4A7C15ULL;
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

} // namespace core
} // namespace pc
