// cppcheck-suppress-file missingIncludeSystem
#include "rule_store.hpp"

#include <algorithm>

#include "expression.hpp"
#include "logging.hpp"
#include "rule.hpp"
#include "rules_digest.hpp"
#include "tracing.hpp"

namespace binauthz {

namespace {

constexpr const char* kRuleColumns = "identifier, state, type, custommsg, customurl, timestamp, comment, cel_expr";

std::string active_rules_trace_id()
{
    std::string trace_id = current_trace_id();
    if (!trace_id.empty()) {
        return trace_id;
    }
    return make_span_id("trace-rules");
}

const char* cleanup_name(RuleCleanup cleanup)
{
    switch (cleanup) {
        case RuleCleanup::None:
            return "none";
        case RuleCleanup::All:
            return "all";
        case RuleCleanup::NonTransitive:
            return "non_transitive";
    }
    return "none";
}

Rule rule_from_row(const SqliteStatement& stmt)
{
    Rule rule;
    rule.identifier = stmt.column_text(0);
    rule.state = rule_state_from_int(stmt.column_int64(1));
    rule.type = rule_type_from_int(stmt.column_int64(2));
    rule.custom_msg = stmt.column_text(3);
    rule.custom_url = stmt.column_text(4);
    rule.timestamp = stmt.column_int64(5);
    rule.comment = stmt.column_text(6);
    rule.expression = stmt.column_text(7);
    return rule;
}

// Schema history. Step N upgrades a version N-1 table to version N.
const std::vector<std::vector<std::string>>& migration_steps()
{
    static const std::vector<std::vector<std::string>> steps = {
        {
            "CREATE TABLE IF NOT EXISTS rules (shasum TEXT NOT NULL, state INTEGER NOT NULL, "
            "type INTEGER NOT NULL, custommsg TEXT)",
            "CREATE UNIQUE INDEX IF NOT EXISTS rulesunique ON rules (shasum, type)",
        },
        {
            "DROP VIEW IF EXISTS binrules",
            "DROP VIEW IF EXISTS certrules",
        },
        {
            "ALTER TABLE rules ADD timestamp INTEGER",
        },
        {
            "ALTER TABLE rules RENAME COLUMN shasum TO identifier",
        },
        {
            // Legacy codes are remapped so the numeric value is the precedence rank.
            "UPDATE rules SET type = 1000 WHERE type = 1",
            "UPDATE rules SET type = 3000 WHERE type = 2",
            "UPDATE rules SET type = 4000 WHERE type = 3",
            "UPDATE rules SET type = 2000 WHERE type = 4",
        },
        {
            "UPDATE rules SET identifier = LOWER(identifier) WHERE type = 1000 OR type = 3000",
            "UPDATE rules SET identifier = UPPER(identifier) WHERE type = 4000",
        },
        {
            "ALTER TABLE rules ADD customurl TEXT",
        },
        {
            "ALTER TABLE rules ADD comment TEXT",
        },
        {
            "ALTER TABLE rules ADD cel_expr TEXT",
        },
    };
    return steps;
}

} // namespace

RuleStore::RuleStore(RuleStoreOptions options) : options_(std::move(options))
{
    if (!options_.clock) {
        options_.clock = rule_timestamp_now;
    }
    culler_ = std::make_unique<TransitiveRuleCuller>(*this, options_.cull, options_.clock);
}

RuleStore::~RuleStore() = default;

Result<void> RuleStore::require_open() const
{
    if (!db_.is_open()) {
        return Error(ErrorCode::DatabaseUnavailable, "Rule database is not open");
    }
    return {};
}

Result<void> RuleStore::open(const std::string& path)
{
    ScopedSpan span("rules.open", active_rules_trace_id(), current_span_id());
    std::lock_guard<std::mutex> lock(mu_);

    version_ = 0;
    clean_sync_required_ = false;
    digest_.reset();

    auto opened = db_.open(path);
    if (!opened) {
        span.fail(opened.error().to_string());
        logger().log(SLOG_ERROR("Failed to open rule database").field("path", path).field("error",
                                                                                             opened.error().to_string()));
        return opened.error();
    }

    // Keep other processes out of the rule table while we hold it.
    auto locked = db_.exec("PRAGMA locking_mode = EXCLUSIVE");
    if (!locked) {
        logger().log(SLOG_WARN("Could not take exclusive lock on rule database")
                         .field("path", path)
                         .field("error", locked.error().to_string()));
    }

    auto version = db_.user_version();
    if (!version) {
        span.fail(version.error().to_string());
        db_.close();
        return Error(ErrorCode::DatabaseOpenFailed, "Could not read rule database version", version.error().to_string());
    }

    auto migrated = migrate_locked(*version);
    if (!migrated) {
        span.fail(migrated.error().to_string());
        logger().log(SLOG_ERROR("Rule database migration failed")
                         .field("path", path)
                         .field("error", migrated.error().to_string()));
        db_.close();
        return migrated.error();
    }

    logger().log(SLOG_INFO("Rule database ready")
                     .field("path", path)
                     .field("from_version", *version)
                     .field("version", version_));
    return {};
}

void RuleStore::close()
{
    std::lock_guard<std::mutex> lock(mu_);
    db_.close();
    digest_.reset();
}

bool RuleStore::is_open() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return db_.is_open();
}

uint32_t RuleStore::current_version() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return version_;
}

bool RuleStore::clean_sync_required() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return clean_sync_required_;
}

Result<uint32_t> RuleStore::migrate(uint32_t from_version)
{
    std::lock_guard<std::mutex> lock(mu_);
    return migrate_locked(from_version);
}

Result<void> RuleStore::apply_migration_step(uint32_t version, const std::vector<std::string>& statements)
{
    SqliteTransaction tx(db_);
    auto begun = tx.begin();
    if (!begun) {
        return Error(ErrorCode::MigrationFailed, "Could not begin migration to version " + std::to_string(version),
                     begun.error().to_string());
    }
    for (const auto& sql : statements) {
        auto result = db_.exec(sql);
        if (!result) {
            return Error(ErrorCode::MigrationFailed, "Migration to version " + std::to_string(version) + " failed",
                         result.error().to_string());
        }
    }
    auto bumped = db_.set_user_version(version);
    if (!bumped) {
        return Error(ErrorCode::MigrationFailed, "Could not record version " + std::to_string(version),
                     bumped.error().to_string());
    }
    auto committed = tx.commit();
    if (!committed) {
        return Error(ErrorCode::MigrationFailed, "Could not commit migration to version " + std::to_string(version),
                     committed.error().to_string());
    }
    return {};
}

Result<uint32_t> RuleStore::migrate_locked(uint32_t from_version)
{
    TRY(require_open());

    // Steps already recorded in the file are never replayed.
    auto persisted = db_.user_version();
    if (!persisted) {
        return Error(ErrorCode::MigrationFailed, "Could not read rule database version",
                     persisted.error().to_string());
    }
    const uint32_t start = std::max(from_version, *persisted);
    if (start > kRuleTableCurrentVersion) {
        return Error(ErrorCode::MigrationFailed, "Rule database is newer than this build",
                     "version " + std::to_string(start));
    }

    ScopedSpan span("rules.migrate", active_rules_trace_id(), current_span_id());
    const auto& steps = migration_steps();
    uint32_t version = start;
    for (uint32_t target = start + 1; target <= kRuleTableCurrentVersion; ++target) {
        auto applied = apply_migration_step(target, steps[target - 1]);
        if (!applied) {
            span.fail(applied.error().to_string());
            version_ = version;
            return applied.error();
        }
        logger().log(SLOG_DEBUG("Applied rule table migration").field("version", target));
        version = target;
    }

    if (start < 1) {
        clean_sync_required_ = true;
    }
    version_ = version;
    return version;
}

Result<void> RuleStore::add_rules(const std::vector<Rule>& rules, RuleCleanup cleanup)
{
    if (rules.empty() && cleanup == RuleCleanup::None) {
        return Error(ErrorCode::EmptyRuleArray, "Empty rule array");
    }

    ScopedSpan root_span("rules.add_rules", active_rules_trace_id(), current_span_id());
    auto fail = [&](const Error& err) -> Result<void> {
        root_span.fail(err.to_string());
        logger().log(SLOG_WARN("Rejected rule batch")
                         .field("rules", static_cast<uint64_t>(rules.size()))
                         .field("cleanup", cleanup_name(cleanup))
                         .field("error", err.to_string()));
        return err;
    };

    std::vector<Rule> validated;
    validated.reserve(rules.size());
    {
        ScopedSpan span("rules.validate", root_span.trace_id(), root_span.span_id());
        const int64_t now = options_.clock();
        for (const auto& rule : rules) {
            auto checked = validate_rule(rule);
            if (!checked) {
                span.fail(checked.error().to_string());
                return fail(Error(checked.error().code(), "Rule array contained invalid entry",
                                  checked.error().message() + " (" + describe_rule(rule) + ")"));
            }
            if (checked->state == RuleState::CEL && options_.evaluator) {
                auto compiled = options_.evaluator->validate(checked->expression);
                if (!compiled) {
                    span.fail(compiled.error().to_string());
                    return fail(Error(ErrorCode::RuleInvalidExpression,
                                      "Rule array contained rule with invalid CEL expression",
                                      compiled.error().detail().empty() ? compiled.error().message()
                                                                        : compiled.error().detail()));
                }
            }
            if (checked->timestamp == 0) {
                checked->timestamp = now;
            }
            validated.push_back(std::move(*checked));
        }
    }

    std::lock_guard<std::mutex> lock(mu_);
    auto ready = require_open();
    if (!ready) {
        return fail(ready.error());
    }

    {
        ScopedSpan span("rules.commit", root_span.trace_id(), root_span.span_id());
        auto applied = apply_rules_locked(validated, cleanup);
        if (!applied) {
            span.fail(applied.error().to_string());
            return fail(applied.error());
        }
    }

    digest_.reset();
    logger().log(SLOG_INFO("Rules added")
                     .field("rules", static_cast<uint64_t>(validated.size()))
                     .field("cleanup", cleanup_name(cleanup)));
    return {};
}

Result<void> RuleStore::apply_rules_locked(const std::vector<Rule>& rules, RuleCleanup cleanup)
{
    SqliteTransaction tx(db_);
    auto begun = tx.begin();
    if (!begun) {
        return Error(ErrorCode::InsertOrReplaceRuleFailed, "Could not begin rule transaction",
                     begun.error().to_string());
    }

    if (cleanup != RuleCleanup::None) {
        auto wiped = cleanup == RuleCleanup::All
                         ? db_.exec("DELETE FROM rules")
                         : db_.exec("DELETE FROM rules WHERE state != " +
                                    std::to_string(static_cast<int32_t>(RuleState::AllowTransitive)));
        if (!wiped) {
            return Error(ErrorCode::RemoveRuleFailed, "A database error occurred while cleaning up rules",
                         wiped.error().to_string());
        }
    }

    auto remove_stmt = db_.prepare("DELETE FROM rules WHERE identifier=? AND type=?");
    if (!remove_stmt) {
        return Error(ErrorCode::RemoveRuleFailed, "Could not prepare rule removal", remove_stmt.error().to_string());
    }
    auto insert_stmt = db_.prepare(std::string("INSERT OR REPLACE INTO rules (") + kRuleColumns +
                                   ") VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    if (!insert_stmt) {
        return Error(ErrorCode::InsertOrReplaceRuleFailed, "Could not prepare rule insert",
                     insert_stmt.error().to_string());
    }

    auto remove_one = [&](const Rule& rule) -> Result<void> {
        SqliteStatement& stmt = *remove_stmt;
        TRY(stmt.reset());
        TRY(stmt.bind_text(1, rule.identifier));
        TRY(stmt.bind_int64(2, static_cast<int64_t>(rule.type)));
        auto done = stmt.step();
        if (!done) {
            return done.error();
        }
        return {};
    };

    auto insert_one = [&](const Rule& rule) -> Result<void> {
        SqliteStatement& stmt = *insert_stmt;
        TRY(stmt.reset());
        TRY(stmt.bind_text(1, rule.identifier));
        TRY(stmt.bind_int64(2, static_cast<int64_t>(rule.state)));
        TRY(stmt.bind_int64(3, static_cast<int64_t>(rule.type)));
        TRY(stmt.bind_optional_text(4, rule.custom_msg));
        TRY(stmt.bind_optional_text(5, rule.custom_url));
        TRY(stmt.bind_int64(6, rule.timestamp));
        TRY(stmt.bind_optional_text(7, rule.comment));
        TRY(stmt.bind_optional_text(8, rule.expression));
        auto done = stmt.step();
        if (!done) {
            return done.error();
        }
        return {};
    };

    for (const auto& rule : rules) {
        if (rule.state == RuleState::Remove) {
            auto removed = remove_one(rule);
            if (!removed) {
                return Error(ErrorCode::RemoveRuleFailed, "A database error occurred while deleting a rule",
                             removed.error().to_string());
            }
        } else {
            auto inserted = insert_one(rule);
            if (!inserted) {
                return Error(ErrorCode::InsertOrReplaceRuleFailed,
                             "A database error occurred while inserting/replacing a rule",
                             inserted.error().to_string());
            }
        }
    }

    auto committed = tx.commit();
    if (!committed) {
        return Error(ErrorCode::InsertOrReplaceRuleFailed, "Could not commit rule transaction",
                     committed.error().to_string());
    }
    return {};
}

Result<int64_t> RuleStore::count_locked(const std::string& sql, std::optional<int64_t> param)
{
    TRY(require_open());
    auto stmt = db_.prepare(sql);
    if (!stmt) {
        return stmt.error();
    }
    if (param) {
        TRY(stmt->bind_int64(1, *param));
    }
    auto row = stmt->step();
    if (!row) {
        return row.error();
    }
    return *row ? stmt->column_int64(0) : int64_t{0};
}

Result<int64_t> RuleStore::rule_count()
{
    std::lock_guard<std::mutex> lock(mu_);
    return count_locked("SELECT COUNT(*) FROM rules", std::nullopt);
}

Result<int64_t> RuleStore::rule_count_by_type(RuleType type)
{
    std::lock_guard<std::mutex> lock(mu_);
    return count_locked("SELECT COUNT(*) FROM rules WHERE type=?", static_cast<int64_t>(type));
}

Result<int64_t> RuleStore::compiler_rule_count()
{
    std::lock_guard<std::mutex> lock(mu_);
    return count_locked("SELECT COUNT(*) FROM rules WHERE state=?", static_cast<int64_t>(RuleState::AllowCompiler));
}

Result<int64_t> RuleStore::transitive_rule_count()
{
    std::lock_guard<std::mutex> lock(mu_);
    return count_locked("SELECT COUNT(*) FROM rules WHERE state=?",
                        static_cast<int64_t>(RuleState::AllowTransitive));
}

Result<RuleCounts> RuleStore::rule_counts()
{
    std::lock_guard<std::mutex> lock(mu_);
    const std::string by_type = "SELECT COUNT(*) FROM rules WHERE type=?";
    const std::string by_state = "SELECT COUNT(*) FROM rules WHERE state=?";

    struct Query {
        int64_t* target;
        const std::string* sql;
        std::optional<int64_t> param;
    };

    RuleCounts counts;
    const std::string total = "SELECT COUNT(*) FROM rules";
    const Query queries[] = {
        {&counts.total, &total, std::nullopt},
        {&counts.binary, &by_type, static_cast<int64_t>(RuleType::Binary)},
        {&counts.certificate, &by_type, static_cast<int64_t>(RuleType::Certificate)},
        {&counts.teamid, &by_type, static_cast<int64_t>(RuleType::TeamID)},
        {&counts.signingid, &by_type, static_cast<int64_t>(RuleType::SigningID)},
        {&counts.cdhash, &by_type, static_cast<int64_t>(RuleType::CDHash)},
        {&counts.compiler, &by_state, static_cast<int64_t>(RuleState::AllowCompiler)},
        {&counts.transitive, &by_state, static_cast<int64_t>(RuleState::AllowTransitive)},
    };
    for (const auto& query : queries) {
        auto count = count_locked(*query.sql, query.param);
        if (!count) {
            return count.error();
        }
        *query.target = *count;
    }
    return counts;
}

Result<std::vector<Rule>> RuleStore::retrieve_all_rules()
{
    std::lock_guard<std::mutex> lock(mu_);
    TRY(require_open());
    auto stmt = db_.prepare(std::string("SELECT ") + kRuleColumns + " FROM rules ORDER BY rowid");
    if (!stmt) {
        return stmt.error();
    }

    std::vector<Rule> rules;
    while (true) {
        auto row = stmt->step();
        if (!row) {
            return row.error();
        }
        if (!*row) {
            break;
        }
        rules.push_back(rule_from_row(*stmt));
    }
    return rules;
}

Result<std::optional<Rule>> RuleStore::find_rule(const RuleIdentifiers& identifiers)
{
    const RuleIdentifiers ids = normalize_identifiers(identifiers);

    std::lock_guard<std::mutex> lock(mu_);
    TRY(require_open());

    // The ORDER BY carries precedence; each identifier is compared only against its own type code.
    auto stmt = db_.prepare(std::string("SELECT ") + kRuleColumns +
                            " FROM rules WHERE (identifier=?1 AND type=500) OR (identifier=?2 AND type=1000) OR "
                            "(identifier=?3 AND type=2000) OR (identifier=?4 AND type=3000) OR "
                            "(identifier=?5 AND type=4000) ORDER BY type ASC LIMIT 1");
    if (!stmt) {
        return stmt.error();
    }
    TRY(stmt->bind_optional_text(1, ids.cdhash));
    TRY(stmt->bind_optional_text(2, ids.binary_sha256));
    TRY(stmt->bind_optional_text(3, ids.signing_id));
    TRY(stmt->bind_optional_text(4, ids.certificate_sha256));
    TRY(stmt->bind_optional_text(5, ids.team_id));

    auto row = stmt->step();
    if (!row) {
        return row.error();
    }
    if (!*row) {
        return std::optional<Rule>();
    }
    return std::optional<Rule>(rule_from_row(*stmt));
}

Result<bool> RuleStore::has_rule(const std::string& identifier, RuleType type, RuleState state,
                                 const std::string& expression)
{
    std::lock_guard<std::mutex> lock(mu_);
    TRY(require_open());
    auto stmt = db_.prepare(
        "SELECT 1 FROM rules WHERE identifier=? AND type=? AND state=? AND IFNULL(cel_expr, '')=? LIMIT 1");
    if (!stmt) {
        return stmt.error();
    }
    TRY(stmt->bind_text(1, identifier));
    TRY(stmt->bind_int64(2, static_cast<int64_t>(type)));
    TRY(stmt->bind_int64(3, static_cast<int64_t>(state)));
    TRY(stmt->bind_text(4, expression));
    return stmt->step();
}

Result<bool> RuleStore::has_compiler_rule(const std::string& identifier)
{
    std::lock_guard<std::mutex> lock(mu_);
    TRY(require_open());
    auto stmt = db_.prepare("SELECT 1 FROM rules WHERE identifier=? AND type IN (500, 1000, 2000) AND state=? LIMIT 1");
    if (!stmt) {
        return stmt.error();
    }
    TRY(stmt->bind_text(1, identifier));
    TRY(stmt->bind_int64(2, static_cast<int64_t>(RuleState::AllowCompiler)));
    return stmt->step();
}

void RuleStore::reset_timestamp(const Rule& rule)
{
    const int64_t now = options_.clock();
    const std::string identifier = normalize_identifier(rule.type, rule.identifier);

    std::lock_guard<std::mutex> lock(mu_);
    auto updated = [&]() -> Result<void> {
        TRY(require_open());
        auto stmt = db_.prepare("UPDATE rules SET timestamp=? WHERE identifier=? AND type=?");
        if (!stmt) {
            return stmt.error();
        }
        TRY(stmt->bind_int64(1, now));
        TRY(stmt->bind_text(2, identifier));
        TRY(stmt->bind_int64(3, static_cast<int64_t>(rule.type)));
        auto done = stmt->step();
        if (!done) {
            return done.error();
        }
        return {};
    }();
    if (!updated) {
        logger().log(SLOG_ERROR("Could not update timestamp for rule")
                         .field("identifier", identifier)
                         .field("type", rule_type_name(rule.type))
                         .field("error", updated.error().to_string()));
    }
}

int64_t RuleStore::remove_outdated_transitive_rules()
{
    return culler_->run();
}

Result<int64_t> RuleStore::delete_transitive_rules_older_than(int64_t cutoff)
{
    std::lock_guard<std::mutex> lock(mu_);
    TRY(require_open());
    auto stmt = db_.prepare("DELETE FROM rules WHERE state=? AND timestamp < ?");
    if (!stmt) {
        return stmt.error();
    }
    TRY(stmt->bind_int64(1, static_cast<int64_t>(RuleState::AllowTransitive)));
    TRY(stmt->bind_int64(2, cutoff));
    auto done = stmt->step();
    if (!done) {
        return done.error();
    }
    return db_.changes();
}

Result<std::string> RuleStore::rules_digest()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (digest_) {
        return *digest_;
    }
    TRY(require_open());

    auto stmt = db_.prepare("SELECT identifier, state, type, cel_expr FROM rules WHERE state != ? ORDER BY rowid");
    if (!stmt) {
        return stmt.error();
    }
    TRY(stmt->bind_int64(1, static_cast<int64_t>(RuleState::AllowTransitive)));

    RulesDigestBuilder builder;
    while (true) {
        auto row = stmt->step();
        if (!row) {
            return row.error();
        }
        if (!*row) {
            break;
        }
        builder.add_rule(stmt->column_text(0), stmt->column_text(3),
                         static_cast<RuleState>(stmt->column_int64(1)), static_cast<RuleType>(stmt->column_int64(2)));
    }

    auto digest = builder.hex();
    if (!digest) {
        return digest.error();
    }
    digest_ = *digest;
    logger().log(SLOG_DEBUG("Computed rules digest")
                     .field("digest", *digest_)
                     .field("rules", static_cast<uint64_t>(builder.rules())));
    return *digest_;
}

} // namespace binauthz
