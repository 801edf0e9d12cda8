#include <rb/core/uniform_rng.hpp>

#include <random>     // std::mt19937_64, std::uniform_real_distribution
#include <memory>     // std::make_unique
#include <stdexcept>  // std::invalid_argument, std::out_of_range
#include <utility>    // std::move

namespace rb {
namespace core {

namespace {
// Graine par défaut : constante "golden ratio" de Knuth.
constexpr std::uint64_t DEFAULT_SEED = 0x9E3779B97F4A7C15ULL;

// SplitMix64 (Steele, Lea, Flood) : un pas de mélange.
inline std::uint64_t splitmix64(std::uint64_t x) noexcept {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}
} // anonymous namespace

// --- PIMPL -------------------------------------------------------------------

struct UniformRng::Impl {
  std::mt19937_64 eng;
  std::uniform_real_distribution<double> ud;

  Impl() : eng(), ud(0.0, 1.0) {}
};

// --- UniformRng --------------------------------------------------------------

UniformRng::UniformRng()
    : pimpl_(std::make_unique<Impl>()), seed_(DEFAULT_SEED) {
  pimpl_->eng.seed(seed_);
}

UniformRng::UniformRng(std::uint64_t seed)
    : pimpl_(std::make_unique<Impl>()), seed_(seed) {
  pimpl_->eng.seed(seed_);
}

UniformRng::UniformRng(const UniformRng& other)
    : pimpl_(std::make_unique<Impl>()), seed_(other.seed_) {
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
    : pimpl_(std::move(other.pimpl_)), seed_(other.seed_) {}

UniformRng& UniformRng::operator=(UniformRng&& other) noexcept {
  if (this != &other) {
    pimpl_ = std::move(other.pimpl_);
    seed_  = other.seed_;
  }
  return *this;
}

UniformRng::~UniformRng() noexcept = default;

std::uint64_t UniformRng::seed() const noexcept {
  return seed_;
}

double UniformRng::uniform() {
  // Certaines libstdc++ peuvent renvoyer 1.0 par arrondi : on retire, pour
  // rester dans [0,1) sans surpondérer 0.
  double u = pimpl_->ud(pimpl_->eng);
  while (u >= 1.0) u = pimpl_->ud(pimpl_->eng);
  return u;
}

void UniformRng::uniform_block(double* out, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = uniform();
  }
}

// --- SequenceRng -------------------------------------------------------------

SequenceRng::SequenceRng(std::vector<double> values, bool cycle)
    : values_(std::move(values)), cycle_(cycle) {
  if (values_.empty()) {
    throw std::invalid_argument("SequenceRng: empty sequence");
  }
  for (double v : values_) {
    if (!(v >= 0.0 && v < 1.0)) {
      throw std::invalid_argument("SequenceRng: values must lie in [0,1)");
    }
  }
}

double SequenceRng::uniform() {
  if (pos_ == values_.size()) {
    if (!cycle_) {
      throw std::out_of_range("SequenceRng: sequence exhausted");
    }
    pos_ = 0;
  }
  ++consumed_;
  return values_[pos_++];
}

std::size_t SequenceRng::remaining() const noexcept {
  return values_.size() - pos_;
}

// --- Flux dérivés -------------------------------------------------------------

std::uint64_t derive_seed(std::uint64_t master, std::size_t stream) noexcept {
  if (stream == 0) return master;
  return splitmix64(master ^ splitmix64(static_cast<std::uint64_t>(stream)));
}

} // namespace core
} // namespace rb
