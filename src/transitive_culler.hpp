// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

#include "types.hpp"

namespace binauthz {

class RuleStore;

// Seconds since the rule timestamp epoch.
using RuleClock = std::function<int64_t()>;

struct TransitiveCullConfig {
    int64_t threshold = kTransitiveRuleCullingThreshold;
    int64_t expiry_seconds = kTransitiveRuleExpirationSeconds;
    int64_t interval_seconds = kTransitiveRuleCullingIntervalSeconds;
};

// Defaults overridden by BINAUTHZ_TRANSITIVE_CULL_THRESHOLD,
// BINAUTHZ_TRANSITIVE_EXPIRY_SECONDS and BINAUTHZ_TRANSITIVE_CULL_INTERVAL_SECONDS.
TransitiveCullConfig transitive_cull_config_from_env();

/**
 * Deletes AllowTransitive rules that have not been used within the expiry
 * window, but only once the store is large enough to care and no more than
 * once per interval. Errors are logged, never returned.
 */
class TransitiveRuleCuller {
  public:
    TransitiveRuleCuller(RuleStore& store, TransitiveCullConfig config, RuleClock clock);

    TransitiveRuleCuller(const TransitiveRuleCuller&) = delete;
    TransitiveRuleCuller& operator=(const TransitiveRuleCuller&) = delete;

    // Number of rules deleted; 0 when the run was skipped.
    int64_t run();

    [[nodiscard]] std::optional<int64_t> last_run() const;
    [[nodiscard]] const TransitiveCullConfig& config() const { return config_; }

  private:
    RuleStore& store_;
    TransitiveCullConfig config_;
    RuleClock clock_;
    mutable std::mutex mu_;
    std::optional<int64_t> last_run_;
};

} // namespace binauthz
