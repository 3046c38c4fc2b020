#pragma once

// warden/retry.hpp: Retry strategy selection.
//
// DESIGN INVARIANTS:
//   1. NO REPEATS: a strategy name is never returned twice for one operation.
//   2. BOUNDED: at most min(max_attempts, |strategies|) attempts per operation.
//   3. ORDER: untried strategies are offered in profile order.
//   4. STATELESS: the decision is a pure function of the attempt history.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

class RetryStrategy {
 public:
  explicit RetryStrategy(std::uint32_t max_attempts = 3) : max_attempts_(max_attempts) {}

  // Next strategy to try, or nullopt when the operation must stop retrying.
  std::optional<std::string> next_strategy(const std::string& tool_name,
                                           const std::vector<AttemptRecord>& previous_attempts) const;

  std::uint32_t max_attempts() const { return max_attempts_; }

 private:
  std::uint32_t max_attempts_;
};

}  // namespace warden
