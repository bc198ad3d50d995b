#include "callpop/backoff.hpp"

#include <algorithm>
#include <cmath>

namespace callpop {

Backoff::Backoff(const ReconnectPolicy& policy, unsigned seed)
    : policy_(policy), rng_(seed) {}

std::chrono::milliseconds Backoff::next() {
  const double base = static_cast<double>(policy_.base_delay.count());
  const double cap = static_cast<double>(policy_.max_delay.count());
  // Exponent is clamped so the double cannot overflow on long outages
  double nominal = std::min(cap, base * std::pow(2.0, std::min(attempts_, 30)));

  double factor = 1.0;
  if (policy_.jitter > 0.0) {
    std::uniform_real_distribution<double> dist(0.0, policy_.jitter);
    factor -= dist(rng_);
  }
  auto delay = std::chrono::milliseconds(static_cast<long long>(nominal * factor));
  delay = std::max(delay, last_);
  delay = std::min(delay, policy_.max_delay);

  attempts_++;
  last_ = delay;
  return delay;
}

void Backoff::reset() {
  attempts_ = 0;
  last_ = std::chrono::milliseconds(0);
}

bool Backoff::exhausted() const {
  return policy_.max_attempts > 0 && attempts_ >= policy_.max_attempts;
}

}  // namespace callpop
