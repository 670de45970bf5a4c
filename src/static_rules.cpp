// cppcheck-suppress-file missingIncludeSystem
#include "static_rules.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <unordered_set>

#include "expression.hpp"
#include "logging.hpp"
#include "rule.hpp"
#include "utils.hpp"

namespace binauthz {

namespace {

const std::unordered_set<std::string>& valid_rule_keys()
{
    static const std::unordered_set<std::string> keys = {"identifier", "sha256",     "policy",  "rule_type",
                                                         "custom_msg", "custom_url", "comment", "cel_expr"};
    return keys;
}

} // namespace

void report_static_rule_issues(const PolicyIssues& issues)
{
    for (const auto& err : issues.errors) {
        logger().log(SLOG_ERROR("Static rules error").field("detail", err));
    }
    for (const auto& warn : issues.warnings) {
        logger().log(SLOG_WARN("Static rules warning").field("detail", warn));
    }
}

Result<std::vector<RuleDictionary>> parse_static_rules_file(const std::string& path, PolicyIssues& issues)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        issues.errors.push_back("Failed to open '" + path + "': " + std::strerror(errno));
        return Error(ErrorCode::StaticRulesParseFailed, "Failed to open static rules file", path);
    }

    std::vector<RuleDictionary> rules;
    bool in_rule = false;
    bool in_header = true;
    uint64_t version = 0;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            const std::string section = trim(trimmed.substr(1, trimmed.size() - 2));
            in_header = false;
            if (section == "rule") {
                rules.emplace_back();
                in_rule = true;
            } else {
                issues.errors.push_back("line " + std::to_string(line_no) + ": unknown section '" + section + "'");
                in_rule = false;
            }
            continue;
        }

        std::string key;
        std::string value;
        if (!parse_key_value(trimmed, key, value)) {
            issues.errors.push_back("line " + std::to_string(line_no) + ": expected key=value");
            continue;
        }

        if (in_header) {
            if (key == "version") {
                if (!parse_uint64(value, version) || version == 0) {
                    issues.errors.push_back("line " + std::to_string(line_no) + ": invalid version");
                    version = 0;
                }
            } else {
                issues.errors.push_back("line " + std::to_string(line_no) + ": unknown header key '" + key + "'");
            }
            continue;
        }

        if (!in_rule) {
            // Already reported as an unknown section.
            continue;
        }

        if (valid_rule_keys().find(key) == valid_rule_keys().end()) {
            issues.errors.push_back("line " + std::to_string(line_no) + ": unknown rule key '" + key + "'");
            continue;
        }
        auto& rule = rules.back();
        if (rule.count(key)) {
            issues.warnings.push_back("line " + std::to_string(line_no) + ": duplicate key '" + key +
                                      "' overrides earlier value");
        }
        rule[key] = value;
    }

    if (version == 0) {
        issues.errors.push_back("missing header key: version");
    } else if (version != 1) {
        issues.errors.push_back("unsupported static rules version: " + std::to_string(version));
    }

    if (!issues.errors.empty()) {
        return Error(ErrorCode::StaticRulesParseFailed, "Static rules parsing failed with errors", path);
    }
    return rules;
}

std::shared_ptr<const StaticRuleMap> build_static_rules(const std::vector<RuleDictionary>& dictionaries,
                                                        ExpressionEvaluator* evaluator, PolicyIssues& issues)
{
    auto rules = std::make_shared<StaticRuleMap>();
    rules->reserve(dictionaries.size());

    size_t index = 0;
    for (const auto& dict : dictionaries) {
        ++index;
        auto rule = rule_from_dictionary(dict);
        if (!rule) {
            issues.warnings.push_back("static rule " + std::to_string(index) + " skipped: " + rule.error().to_string());
            continue;
        }
        if (rule->state == RuleState::Remove) {
            issues.warnings.push_back("static rule " + std::to_string(index) + " skipped: REMOVE is not a standing rule");
            continue;
        }
        if (rule->state == RuleState::CEL && evaluator) {
            auto compiled = evaluator->validate(rule->expression);
            if (!compiled) {
                issues.warnings.push_back("static rule " + std::to_string(index) +
                                          " skipped: " + compiled.error().to_string());
                continue;
            }
        }
        (*rules)[rule->identifier] = *rule;
    }
    return rules;
}

StaticRuleOverlay::StaticRuleOverlay() : rules_(std::make_shared<const StaticRuleMap>()) {}

std::shared_ptr<const StaticRuleMap> StaticRuleOverlay::snapshot() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return rules_;
}

void StaticRuleOverlay::replace(std::shared_ptr<const StaticRuleMap> rules)
{
    if (!rules) {
        rules = std::make_shared<const StaticRuleMap>();
    }
    std::lock_guard<std::mutex> lock(mu_);
    rules_ = std::move(rules);
}

size_t StaticRuleOverlay::update(const std::vector<RuleDictionary>& dictionaries, ExpressionEvaluator* evaluator)
{
    PolicyIssues issues;
    auto rules = build_static_rules(dictionaries, evaluator, issues);
    report_static_rule_issues(issues);
    const size_t count = rules->size();
    replace(std::move(rules));
    logger().log(SLOG_INFO("Static rules updated")
                     .field("rules", static_cast<uint64_t>(count))
                     .field("skipped", static_cast<uint64_t>(issues.warnings.size())));
    return count;
}

void StaticRuleOverlay::clear()
{
    replace(nullptr);
}

size_t StaticRuleOverlay::size() const
{
    return snapshot()->size();
}

} // namespace binauthz
