// cppcheck-suppress-file missingIncludeSystem
#include "cache_invalidation.hpp"

#include "logging.hpp"
#include "rule.hpp"

namespace binauthz {

namespace {

FlushDecision flush_for(FlushReason reason, const std::string& identifier = {})
{
    return FlushDecision{true, reason, identifier};
}

FlushDecision storage_flush(const Rule& rule, const Error& err)
{
    logger().log(SLOG_WARN("Rule lookup failed during cache check; flushing decision cache")
                     .field("identifier", rule.identifier)
                     .field("error", err.to_string()));
    return flush_for(FlushReason::StorageError, rule.identifier);
}

} // namespace

const char* flush_reason_name(FlushReason reason)
{
    switch (reason) {
        case FlushReason::None:
            return "none";
        case FlushReason::RemoveRule:
            return "remove_rule";
        case FlushReason::BulkNonAllowRules:
            return "bulk_non_allow_rules";
        case FlushReason::NewNonAllowRule:
            return "new_non_allow_rule";
        case FlushReason::CompilerRuleOverridden:
            return "compiler_rule_overridden";
        case FlushReason::StorageError:
            return "storage_error";
        case FlushReason::BatchCleanup:
            return "batch_cleanup";
    }
    return "none";
}

FlushDecision evaluate_cache_flush(const std::vector<Rule>& rules, RuleExistenceQueries& queries,
                                   uint64_t non_allow_threshold)
{
    uint64_t non_allow = 0;
    for (const auto& rule : rules) {
        if (rule.state == RuleState::Remove) {
            return flush_for(FlushReason::RemoveRule, rule.identifier);
        }
        if (rule.state != RuleState::Allow) {
            ++non_allow;
            if (non_allow >= non_allow_threshold) {
                return flush_for(FlushReason::BulkNonAllowRules);
            }
        }
    }

    for (const auto& rule : rules) {
        const std::string identifier = normalize_identifier(rule.type, rule.identifier);
        const std::string expression = rule.state == RuleState::CEL ? rule.expression : std::string();

        if (rule.state != RuleState::Allow) {
            auto exists = queries.has_rule(identifier, rule.type, rule.state, expression);
            if (!exists) {
                return storage_flush(rule, exists.error());
            }
            if (!*exists) {
                return flush_for(FlushReason::NewNonAllowRule, identifier);
            }
            continue;
        }

        if (rule.type == RuleType::Certificate || rule.type == RuleType::TeamID) {
            continue;
        }
        auto compiler = queries.has_compiler_rule(identifier);
        if (!compiler) {
            return storage_flush(rule, compiler.error());
        }
        if (*compiler) {
            return flush_for(FlushReason::CompilerRuleOverridden, identifier);
        }
    }

    return {};
}

} // namespace binauthz
