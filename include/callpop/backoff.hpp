#pragma once

#include <chrono>
#include <random>

#include "callpop/config.hpp"

namespace callpop {

// Reconnect delay generator: base * 2^n capped at max_delay, with up to
// `jitter` of each delay taken off at random. Delays never decrease
// between resets.
class Backoff {
public:
  explicit Backoff(const ReconnectPolicy& policy = ReconnectPolicy(),
                   unsigned seed = std::random_device{}());

  std::chrono::milliseconds next();
  void reset();

  int attempts() const { return attempts_; }
  bool exhausted() const;
  const ReconnectPolicy& policy() const { return policy_; }

private:
  ReconnectPolicy policy_;
  int attempts_ = 0;
  std::chrono::milliseconds last_{0};
  std::mt19937 rng_;
};

}  // namespace callpop
