#include <rb/core/stats.hpp>

#include <cmath>    // std::sqrt
#include <limits>   // std::numeric_limits

namespace rb {
namespace core {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
// z pour 95% bilatéral sous normale
constexpr double Z95 = 1.959963984540054;
} // anonymous namespace

// --- RunningStats -----------------------------------------------------------

RunningStats::RunningStats() noexcept = default;

void RunningStats::add(double x) noexcept {
  if (n_ == 0) {
    min_ = x;
    max_ = x;
  } else {
    if (x < min_) min_ = x;
    if (x > max_) max_ = x;
  }
  n_ += 1;
  const double delta  = x - mean_;
  mean_ += delta / static_cast<double>(n_);
  const double delta2 = x - mean_;
  m2_   += delta * delta2;
}

void RunningStats::merge(const RunningStats& other) noexcept {
  if (other.n_ == 0) return;
  if (n_ == 0) {
    *this = other;
    return;
  }
  const double na = static_cast<double>(n_);
  const double nb = static_cast<double>(other.n_);
  const double n  = na + nb;
  const double delta = other.mean_ - mean_;

  mean_ += delta * nb / n;
  m2_   += other.m2_ + delta * delta * na * nb / n;
  n_    += other.n_;
  if (other.min_ < min_) min_ = other.min_;
  if (other.max_ > max_) max_ = other.max_;
}

std::size_t RunningStats::count() const noexcept {
  return n_;
}

double RunningStats::mean() const noexcept {
  return mean_;
}

double RunningStats::sum() const noexcept {
  return mean_ * static_cast<double>(n_);
}

double RunningStats::min() const noexcept {
  return n_ == 0 ? NaN : min_;
}

double RunningStats::max() const noexcept {
  return n_ == 0 ? NaN : max_;
}

double RunningStats::variance() const noexcept {
  if (n_ < 2) {
    return NaN;
  }
  return m2_ / static_cast<double>(n_ - 1);
}

double RunningStats::std_error() const noexcept {
  if (n_ == 0) {
    return NaN;
  }
  const double var = variance(); // NaN si n==1
  return std::sqrt(var / static_cast<double>(n_));
}

// --- Confidence interval 95% ------------------------------------------------

double half_width_95(double std_error) noexcept {
  return Z95 * std_error;
}

ConfidenceInterval confidence_interval_95(double mean, double std_error) noexcept {
  const double half = half_width_95(std_error);
  return { mean - half, mean + half };
}

} // namespace core
} // namespace rb
