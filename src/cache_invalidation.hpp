// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace binauthz {

// Existence checks the invalidation heuristic needs from durable storage.
class RuleExistenceQueries {
  public:
    virtual ~RuleExistenceQueries() = default;

    // Empty and absent expressions compare equal.
    virtual Result<bool> has_rule(const std::string& identifier, RuleType type, RuleState state,
                                  const std::string& expression) = 0;

    // An AllowCompiler row for identifier with type CDHash, Binary or SigningID.
    virtual Result<bool> has_compiler_rule(const std::string& identifier) = 0;
};

enum class FlushReason {
    None,
    RemoveRule,
    BulkNonAllowRules,
    NewNonAllowRule,
    CompilerRuleOverridden,
    StorageError,
    // The batch wipes existing rows before applying its records.
    BatchCleanup,
};

const char* flush_reason_name(FlushReason reason);

struct FlushDecision {
    bool flush = false;
    FlushReason reason = FlushReason::None;
    // Identifier of the record that triggered the flush, if any.
    std::string identifier;
};

/**
 * Decides whether an external decision cache has to be flushed before a batch
 * is committed. The first matching condition across the whole batch wins:
 *
 *  1. any Remove record;
 *  2. the non-Allow record count reaching the bulk threshold;
 *  3. a non-Allow record without an identical stored row;
 *  4. an Allow record for CDHash, Binary or SigningID shadowing a stored
 *     AllowCompiler row.
 *
 * A storage error while checking flushes.
 */
FlushDecision evaluate_cache_flush(const std::vector<Rule>& rules, RuleExistenceQueries& queries,
                                   uint64_t non_allow_threshold = kFlushNonAllowRuleThreshold);

inline bool rules_should_flush_decision_cache(const std::vector<Rule>& rules, RuleExistenceQueries& queries)
{
    return evaluate_cache_flush(rules, queries).flush;
}

} // namespace binauthz
