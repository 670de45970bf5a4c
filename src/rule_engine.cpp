// cppcheck-suppress-file missingIncludeSystem
#include "rule_engine.hpp"

#include "logging.hpp"
#include "utils.hpp"

namespace binauthz {

RuleEngineConfig rule_engine_config_from_env()
{
    RuleEngineConfig config;
    config.db_path = env_or_default("BINAUTHZ_RULES_DB_PATH", kRulesDbPath);
    config.static_rules_path = env_or_default("BINAUTHZ_STATIC_RULES_PATH", "");
    config.cull = transitive_cull_config_from_env();
    return config;
}

RuleEngine::RuleEngine(PrivateTag, RuleEngineConfig config, RuleEngineDeps deps)
    : config_(std::move(config)), evaluator_(std::move(deps.expression_engine)),
      store_(std::make_unique<RuleStore>(RuleStoreOptions{&evaluator_, config_.cull, std::move(deps.clock)})),
      resolver_(*store_, overlay_, anchor_, evaluator_)
{
}

Result<std::unique_ptr<RuleEngine>> RuleEngine::open(const RuleEngineConfig& config, RuleEngineDeps deps)
{
    CodeSigningInspector* inspector = deps.inspector;
    auto engine = std::make_unique<RuleEngine>(PrivateTag{}, config, std::move(deps));

    auto opened = engine->store_->open(config.db_path);
    if (!opened) {
        return opened.error();
    }

    if (inspector) {
        engine->anchor_.initialize(*inspector, critical_binary_paths(*inspector));
    } else {
        logger().log(SLOG_WARN("No code signing inspector configured; critical binaries are not pre-trusted"));
    }

    if (!config.static_rules_path.empty()) {
        auto loaded = engine->load_static_rules_file(config.static_rules_path);
        if (!loaded) {
            logger().log(SLOG_ERROR("Static rules not loaded")
                             .field("path", config.static_rules_path)
                             .field("error", loaded.error().to_string()));
        }
    }

    if (!engine->evaluator_.has_engine()) {
        logger().log(SLOG_WARN("No expression engine configured; CEL rules will block"));
    }
    return Result<std::unique_ptr<RuleEngine>>(std::move(engine));
}

Result<AddRulesOutcome> RuleEngine::add_rules(const std::vector<Rule>& rules, RuleCleanup cleanup)
{
    std::lock_guard<std::mutex> lock(write_mu_);

    const FlushDecision flush = cleanup != RuleCleanup::None ? FlushDecision{true, FlushReason::BatchCleanup, {}}
                                                              : evaluate_cache_flush(rules, *store_);
    TRY(store_->add_rules(rules, cleanup));

    AddRulesOutcome outcome;
    outcome.flush_decision_cache = flush.flush;
    outcome.reason = flush.reason;
    if (flush.flush) {
        logger().log(SLOG_INFO("Rule batch requires decision cache flush")
                         .field("reason", flush_reason_name(flush.reason))
                         .field("identifier", flush.identifier));
    }
    return outcome;
}

std::optional<Rule> RuleEngine::rule_for_identifiers(const RuleIdentifiers& identifiers) const
{
    return resolver_.resolve(identifiers);
}

RuleState RuleEngine::decide(const Rule& rule, const EvaluationContext& context) const
{
    return resolver_.decide(rule, context);
}

std::optional<CachedDecision> RuleEngine::critical_binary_decision(const std::string& sha256,
                                                                   const std::string& signing_id) const
{
    return resolver_.critical_binary_decision(sha256, signing_id);
}

size_t RuleEngine::update_static_rules(const std::vector<RuleDictionary>& rules)
{
    return overlay_.update(rules, &evaluator_);
}

Result<size_t> RuleEngine::load_static_rules_file(const std::string& path)
{
    PolicyIssues issues;
    auto parsed = parse_static_rules_file(path, issues);
    report_static_rule_issues(issues);
    if (!parsed) {
        return parsed.error();
    }
    return update_static_rules(*parsed);
}

Result<std::string> RuleEngine::rules_digest()
{
    return store_->rules_digest();
}

Result<RuleCounts> RuleEngine::rule_counts()
{
    return store_->rule_counts();
}

int64_t RuleEngine::remove_outdated_transitive_rules()
{
    return store_->remove_outdated_transitive_rules();
}

void RuleEngine::reset_timestamp(const Rule& rule)
{
    store_->reset_timestamp(rule);
}

} // namespace binauthz
