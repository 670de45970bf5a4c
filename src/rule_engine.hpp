// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cache_invalidation.hpp"
#include "critical_binaries.hpp"
#include "expression.hpp"
#include "result.hpp"
#include "rule_resolver.hpp"
#include "rule_store.hpp"
#include "static_rules.hpp"
#include "transitive_culler.hpp"
#include "types.hpp"

namespace binauthz {

struct RuleEngineConfig {
    std::string db_path = kRulesDbPath;
    // Empty: no static rules file.
    std::string static_rules_path;
    TransitiveCullConfig cull;
};

// BINAUTHZ_RULES_DB_PATH, BINAUTHZ_STATIC_RULES_PATH and the culling overrides.
RuleEngineConfig rule_engine_config_from_env();

struct RuleEngineDeps {
    // Conditional-rule runtime. Without one, CEL rules always block.
    std::shared_ptr<ExpressionEngine> expression_engine;
    // Signature extraction for the trust anchor. Without one, no binary is pre-trusted.
    CodeSigningInspector* inspector = nullptr;
    RuleClock clock;
};

struct AddRulesOutcome {
    bool flush_decision_cache = false;
    FlushReason reason = FlushReason::None;
};

/**
 * The rule subsystem as one unit: durable store, static overlay, trust
 * anchor, expression evaluator and resolver, wired together.
 */
class RuleEngine {
  public:
    static Result<std::unique_ptr<RuleEngine>> open(const RuleEngineConfig& config, RuleEngineDeps deps = {});

    RuleEngine(const RuleEngine&) = delete;
    RuleEngine& operator=(const RuleEngine&) = delete;

    // Decides on the decision-cache flush against the pre-commit store, then commits.
    // A batch with a cleanup mode other than None always flushes.
    Result<AddRulesOutcome> add_rules(const std::vector<Rule>& rules, RuleCleanup cleanup);

    [[nodiscard]] std::optional<Rule> rule_for_identifiers(const RuleIdentifiers& identifiers) const;
    RuleState decide(const Rule& rule, const EvaluationContext& context) const;
    [[nodiscard]] std::optional<CachedDecision> critical_binary_decision(const std::string& sha256,
                                                                         const std::string& signing_id) const;

    size_t update_static_rules(const std::vector<RuleDictionary>& rules);
    Result<size_t> load_static_rules_file(const std::string& path);

    Result<std::string> rules_digest();
    Result<RuleCounts> rule_counts();
    int64_t remove_outdated_transitive_rules();
    void reset_timestamp(const Rule& rule);

    // Read-only; mutations go through add_rules so the flush check and the
    // commit stay atomic.
    [[nodiscard]] const RuleStore& store() const { return *store_; }
    [[nodiscard]] const RuleEngineConfig& config() const { return config_; }
    [[nodiscard]] size_t static_rule_count() const { return overlay_.size(); }
    [[nodiscard]] size_t critical_binary_count() const { return anchor_.size(); }

  private:
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

  public:
    RuleEngine(PrivateTag, RuleEngineConfig config, RuleEngineDeps deps);

  private:

    RuleEngineConfig config_;
    ExpressionEvaluator evaluator_;
    std::unique_ptr<RuleStore> store_;
    StaticRuleOverlay overlay_;
    CriticalBinaryTrustAnchor anchor_;
    RuleResolver resolver_;
    std::mutex write_mu_;
};

} // namespace binauthz
