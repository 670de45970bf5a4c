// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cache_invalidation.hpp"
#include "result.hpp"
#include "sqlite_db.hpp"
#include "transitive_culler.hpp"
#include "types.hpp"

namespace binauthz {

class ExpressionEvaluator;

struct RuleStoreOptions {
    // Compiles CEL rules at write time. Not owned; may be null.
    ExpressionEvaluator* evaluator = nullptr;
    TransitiveCullConfig cull;
    RuleClock clock;
};

/**
 * Durable, schema-versioned rule table.
 *
 * Every operation, reads included, runs under one mutex so a lookup never
 * observes a migration or a bulk delete half way through. A store whose file
 * could not be opened answers every call with DatabaseUnavailable until a
 * later open() succeeds.
 */
class RuleStore : public RuleExistenceQueries {
  public:
    explicit RuleStore(RuleStoreOptions options = {});
    ~RuleStore() override;

    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    // Opens or creates the database at path and migrates it to the current version.
    Result<void> open(const std::string& path);
    void close();
    [[nodiscard]] bool is_open() const;

    // Applies every migration step above from_version or the version recorded
    // in the file, whichever is higher. Returns the version reached.
    Result<uint32_t> migrate(uint32_t from_version);

    [[nodiscard]] uint32_t current_version() const;
    [[nodiscard]] static constexpr uint32_t current_supported_version() { return kRuleTableCurrentVersion; }

    // Set when open() created the table from scratch; the sync client should
    // follow with a clean sync.
    [[nodiscard]] bool clean_sync_required() const;

    Result<void> add_rules(const std::vector<Rule>& rules, RuleCleanup cleanup);

    Result<int64_t> rule_count();
    Result<int64_t> rule_count_by_type(RuleType type);
    Result<int64_t> binary_rule_count() { return rule_count_by_type(RuleType::Binary); }
    Result<int64_t> certificate_rule_count() { return rule_count_by_type(RuleType::Certificate); }
    Result<int64_t> teamid_rule_count() { return rule_count_by_type(RuleType::TeamID); }
    Result<int64_t> signingid_rule_count() { return rule_count_by_type(RuleType::SigningID); }
    Result<int64_t> cdhash_rule_count() { return rule_count_by_type(RuleType::CDHash); }
    Result<int64_t> compiler_rule_count();
    Result<int64_t> transitive_rule_count();
    Result<RuleCounts> rule_counts();

    // Every row in storage order.
    Result<std::vector<Rule>> retrieve_all_rules();

    // Highest-precedence row matching any of the identifiers, or nullopt.
    Result<std::optional<Rule>> find_rule(const RuleIdentifiers& identifiers);

    Result<bool> has_rule(const std::string& identifier, RuleType type, RuleState state,
                          const std::string& expression) override;
    Result<bool> has_compiler_rule(const std::string& identifier) override;

    // Marks the rule as used now. Failures are logged.
    void reset_timestamp(const Rule& rule);

    // Rate-limited culling of stale AllowTransitive rows; returns rows deleted.
    int64_t remove_outdated_transitive_rules();
    Result<int64_t> delete_transitive_rules_older_than(int64_t cutoff);

    // XXH3-64 digest over non-transitive rules, memoized until the next add_rules commit.
    Result<std::string> rules_digest();

    [[nodiscard]] TransitiveRuleCuller& culler() { return *culler_; }

  private:
    Result<void> require_open() const;
    Result<uint32_t> migrate_locked(uint32_t from_version);
    Result<int64_t> count_locked(const std::string& sql, std::optional<int64_t> param);
    Result<void> apply_migration_step(uint32_t version, const std::vector<std::string>& statements);
    Result<void> apply_rules_locked(const std::vector<Rule>& rules, RuleCleanup cleanup);

    RuleStoreOptions options_;
    std::unique_ptr<TransitiveRuleCuller> culler_;

    mutable std::mutex mu_;
    SqliteDb db_;
    uint32_t version_ = 0;
    bool clean_sync_required_ = false;
    std::optional<std::string> digest_;
};

} // namespace binauthz
