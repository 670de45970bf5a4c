// cppcheck-suppress-file missingIncludeSystem
#include "rule_resolver.hpp"

#include <utility>

#include "logging.hpp"
#include "rule.hpp"
#include "rule_store.hpp"
#include "static_rules.hpp"

namespace binauthz {

RuleResolver::RuleResolver(RuleStore& store, StaticRuleOverlay& overlay, CriticalBinaryTrustAnchor& anchor,
                           ExpressionEvaluator& evaluator)
    : store_(store), overlay_(overlay), anchor_(anchor), evaluator_(evaluator)
{
}

std::optional<Rule> RuleResolver::resolve_static(const RuleIdentifiers& ids) const
{
    auto rules = overlay_.snapshot();
    if (rules->empty()) {
        return std::nullopt;
    }

    const std::pair<RuleType, const std::optional<std::string>*> probes[] = {
        {RuleType::CDHash, &ids.cdhash},
        {RuleType::Binary, &ids.binary_sha256},
        {RuleType::SigningID, &ids.signing_id},
        {RuleType::Certificate, &ids.certificate_sha256},
        {RuleType::TeamID, &ids.team_id},
    };
    for (const auto& [type, value] : probes) {
        if (!*value) {
            continue;
        }
        auto it = rules->find(**value);
        if (it != rules->end() && it->second.type == type) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::optional<Rule> RuleResolver::resolve(const RuleIdentifiers& identifiers) const
{
    const RuleIdentifiers ids = normalize_identifiers(identifiers);

    if (auto rule = resolve_static(ids)) {
        return rule;
    }

    auto found = store_.find_rule(ids);
    if (!found) {
        logger().log(SLOG_ERROR("Rule lookup failed").field("error", found.error().to_string()));
    } else if (*found) {
        return **found;
    }

    const std::string launcher_leaf = anchor_.launcher_leaf_certificate();
    if (ids.certificate_sha256 && !launcher_leaf.empty() && *ids.certificate_sha256 == launcher_leaf) {
        Rule rule;
        rule.identifier = *ids.certificate_sha256;
        rule.type = RuleType::Certificate;
        rule.state = RuleState::Allow;
        return rule;
    }
    return std::nullopt;
}

RuleState RuleResolver::decide(const Rule& rule, const EvaluationContext& context) const
{
    if (rule.state != RuleState::CEL) {
        return rule.state;
    }
    return evaluator_.evaluate(rule.expression, context);
}

std::optional<CachedDecision> RuleResolver::critical_binary_decision(const std::string& sha256,
                                                                     const std::string& signing_id) const
{
    return anchor_.lookup(normalize_identifier(RuleType::Binary, sha256),
                          normalize_identifier(RuleType::SigningID, signing_id));
}

} // namespace binauthz
