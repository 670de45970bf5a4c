// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace binauthz {

class ExpressionEvaluator;

// Identifier -> rule. One entry per identifier; the last definition wins.
using StaticRuleMap = std::unordered_map<std::string, Rule>;

/**
 * Parse a static rules file:
 *
 *   version=1
 *
 *   [rule]
 *   identifier=<hash, team id or signing id>
 *   rule_type=BINARY|CERTIFICATE|TEAMID|SIGNINGID|CDHASH
 *   policy=ALLOWLIST|BLOCKLIST|...
 *   custom_msg=...
 *
 * Every [rule] section yields one dictionary. Problems are collected in
 * issues; any error fails the parse.
 */
Result<std::vector<RuleDictionary>> parse_static_rules_file(const std::string& path, PolicyIssues& issues);

void report_static_rule_issues(const PolicyIssues& issues);

// Invalid entries, and CEL entries that do not compile, are skipped and reported as warnings.
std::shared_ptr<const StaticRuleMap> build_static_rules(const std::vector<RuleDictionary>& dictionaries,
                                                        ExpressionEvaluator* evaluator, PolicyIssues& issues);

// Copy-on-write holder; readers keep whichever snapshot they loaded.
class StaticRuleOverlay {
  public:
    StaticRuleOverlay();

    [[nodiscard]] std::shared_ptr<const StaticRuleMap> snapshot() const;
    void replace(std::shared_ptr<const StaticRuleMap> rules);

    // Rebuilds from dictionaries and swaps the result in. Returns the entry count.
    size_t update(const std::vector<RuleDictionary>& dictionaries, ExpressionEvaluator* evaluator);
    void clear();

    [[nodiscard]] size_t size() const;

  private:
    mutable std::mutex mu_;
    std::shared_ptr<const StaticRuleMap> rules_;
};

} // namespace binauthz
