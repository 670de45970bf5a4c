// cppcheck-suppress-file missingIncludeSystem
#include "transitive_culler.hpp"

#include "logging.hpp"
#include "rule.hpp"
#include "rule_store.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace binauthz {

namespace {

void apply_env_override(const char* key, int64_t& target)
{
    uint64_t value = 0;
    if (!parse_u64_env(key, value)) {
        return;
    }
    if (value == 0 || value > static_cast<uint64_t>(INT64_MAX)) {
        logger().log(SLOG_WARN("Ignoring out-of-range culling override").field("key", key).field("value", value));
        return;
    }
    target = static_cast<int64_t>(value);
}

} // namespace

TransitiveCullConfig transitive_cull_config_from_env()
{
    TransitiveCullConfig config;
    apply_env_override("BINAUTHZ_TRANSITIVE_CULL_THRESHOLD", config.threshold);
    apply_env_override("BINAUTHZ_TRANSITIVE_EXPIRY_SECONDS", config.expiry_seconds);
    apply_env_override("BINAUTHZ_TRANSITIVE_CULL_INTERVAL_SECONDS", config.interval_seconds);
    return config;
}

TransitiveRuleCuller::TransitiveRuleCuller(RuleStore& store, TransitiveCullConfig config, RuleClock clock)
    : store_(store), config_(config), clock_(clock ? std::move(clock) : RuleClock(rule_timestamp_now))
{
}

std::optional<int64_t> TransitiveRuleCuller::last_run() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return last_run_;
}

int64_t TransitiveRuleCuller::run()
{
    std::lock_guard<std::mutex> lock(mu_);
    const int64_t now = clock_();

    if (last_run_ && now - *last_run_ < config_.interval_seconds) {
        return 0;
    }

    auto count = store_.rule_count();
    if (!count) {
        logger().log(SLOG_WARN("Skipping transitive rule culling").field("error", count.error().to_string()));
        return 0;
    }
    if (*count < config_.threshold) {
        return 0;
    }

    std::string trace_id = current_trace_id();
    ScopedSpan span("rules.cull_transitive", trace_id.empty() ? make_span_id("trace-rules") : trace_id,
                    current_span_id());

    const int64_t cutoff = now - config_.expiry_seconds;
    auto removed = store_.delete_transitive_rules_older_than(cutoff);
    last_run_ = now;
    if (!removed) {
        span.fail(removed.error().to_string());
        logger().log(SLOG_ERROR("Could not remove outdated transitive rules").field("error", removed.error().to_string()));
        return 0;
    }

    logger().log(SLOG_INFO("Removed outdated transitive rules")
                     .field("removed", *removed)
                     .field("rule_count", *count)
                     .field("cutoff", cutoff));
    return *removed;
}

} // namespace binauthz
