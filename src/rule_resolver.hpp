// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <optional>
#include <string>

#include "critical_binaries.hpp"
#include "expression.hpp"
#include "types.hpp"

namespace binauthz {

class RuleStore;
class StaticRuleOverlay;

/**
 * Resolves a set of identifiers to the single rule that governs them.
 *
 * Order: static overlay (CDHash, Binary, SigningID, Certificate, TeamID, a hit
 * only counts when the entry's type matches the probed kind), then the durable
 * store ranked the same way, then an ephemeral Allow for binaries signed with
 * the launcher's leaf certificate. Storage errors resolve to no rule.
 */
class RuleResolver {
  public:
    RuleResolver(RuleStore& store, StaticRuleOverlay& overlay, CriticalBinaryTrustAnchor& anchor,
                 ExpressionEvaluator& evaluator);

    [[nodiscard]] std::optional<Rule> resolve(const RuleIdentifiers& identifiers) const;

    // Effective state of a resolved rule; CEL rules are evaluated and fail closed.
    RuleState decide(const Rule& rule, const EvaluationContext& context) const;

    [[nodiscard]] std::optional<CachedDecision> critical_binary_decision(const std::string& sha256,
                                                                         const std::string& signing_id) const;

  private:
    std::optional<Rule> resolve_static(const RuleIdentifiers& identifiers) const;

    RuleStore& store_;
    StaticRuleOverlay& overlay_;
    CriticalBinaryTrustAnchor& anchor_;
    ExpressionEvaluator& evaluator_;
};

} // namespace binauthz
