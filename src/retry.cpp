#include "warden/retry.hpp"

#include <algorithm>

#include "warden/operation_types.hpp"

namespace warden {

std::optional<std::string> RetryStrategy::next_strategy(
    const std::string& tool_name, const std::vector<AttemptRecord>& previous_attempts) const {
  const OperationProfile* profile = find_profile(tool_name);
  if (!profile || profile->strategies.empty()) return std::nullopt;
  if (previous_attempts.empty()) return profile->strategies.front();

  // A read that already worked has nothing to recover from.
  if (!profile->critical) {
    for (const auto& a : previous_attempts) {
      if (a.result.success) return std::nullopt;
    }
  }

  const std::size_t budget =
      std::min<std::size_t>(max_attempts_, profile->strategies.size());
  if (previous_attempts.size() >= budget) return std::nullopt;

  for (const auto& s : profile->strategies) {
    const bool tried = std::any_of(previous_attempts.begin(), previous_attempts.end(),
                                   [&](const AttemptRecord& a) { return a.strategy_name == s; });
    if (!tried) return s;
  }
  return std::nullopt;
}

}  // namespace warden
