// cppcheck-suppress-file missingIncludeSystem
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "rule_store.hpp"
#include "sqlite_db.hpp"
#include "test_support.hpp"
#include "utils.hpp"

namespace binauthz {
namespace {

using test::kBinarySha256;
using test::kCDHash;
using test::kCertSha256;
using test::kSigningId;
using test::kTeamId;
using test::kTransitiveSha256;
using test::make_rule;

class RuleStoreTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
        dir_ = std::make_unique<test::TempDir>("binauthz_rule_store_test");
        now_ = std::make_shared<int64_t>(700000000);
        auto now = now_;
        RuleStoreOptions options;
        options.clock = [now]() { return *now; };
        store_ = std::make_unique<RuleStore>(options);
        auto opened = store_->open(dir_->file("rules.db"));
        ASSERT_TRUE(opened) << opened.error().to_string();
    }

    void TearDown() override
    {
        store_.reset();
        dir_.reset();
    }

    int64_t Count()
    {
        auto count = store_->rule_count();
        EXPECT_TRUE(count) << count.error().to_string();
        return count ? *count : -1;
    }

    void Add(const std::vector<Rule>& rules, RuleCleanup cleanup = RuleCleanup::None)
    {
        auto result = store_->add_rules(rules, cleanup);
        ASSERT_TRUE(result) << result.error().to_string();
    }

    std::optional<Rule> Find(const RuleIdentifiers& ids)
    {
        auto found = store_->find_rule(ids);
        EXPECT_TRUE(found) << found.error().to_string();
        if (!found) {
            return std::nullopt;
        }
        return *found;
    }

    static RuleIdentifiers AllIdentifiers()
    {
        RuleIdentifiers ids;
        ids.cdhash = kCDHash;
        ids.binary_sha256 = kBinarySha256;
        ids.signing_id = kSigningId;
        ids.certificate_sha256 = kCertSha256;
        ids.team_id = kTeamId;
        return ids;
    }

    std::unique_ptr<test::TempDir> dir_;
    std::shared_ptr<int64_t> now_;
    std::unique_ptr<RuleStore> store_;
};

TEST_F(RuleStoreTest, FreshDatabaseIsAtCurrentVersion)
{
    EXPECT_EQ(store_->current_version(), kRuleTableCurrentVersion);
    EXPECT_EQ(RuleStore::current_supported_version(), 9u);
    EXPECT_TRUE(store_->clean_sync_required());
    EXPECT_EQ(Count(), 0);
}

TEST_F(RuleStoreTest, ReopenDoesNotRepeatMigrations)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block)});
    store_->close();

    auto reopened = store_->open(dir_->file("rules.db"));
    ASSERT_TRUE(reopened) << reopened.error().to_string();
    EXPECT_EQ(store_->current_version(), kRuleTableCurrentVersion);
    EXPECT_FALSE(store_->clean_sync_required());
    EXPECT_EQ(Count(), 1);

    auto migrated = store_->migrate(kRuleTableCurrentVersion);
    ASSERT_TRUE(migrated);
    EXPECT_EQ(*migrated, kRuleTableCurrentVersion);
    EXPECT_EQ(Count(), 1);
}

TEST_F(RuleStoreTest, MigrateFromLowerVersionKeepsRecordedVersion)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block)});

    auto migrated = store_->migrate(0);
    ASSERT_TRUE(migrated) << migrated.error().to_string();
    EXPECT_EQ(*migrated, kRuleTableCurrentVersion);
    EXPECT_EQ(store_->current_version(), kRuleTableCurrentVersion);
    store_->close();

    {
        SqliteDb db;
        ASSERT_TRUE(db.open(dir_->file("rules.db")));
        auto version = db.user_version();
        ASSERT_TRUE(version);
        EXPECT_EQ(*version, kRuleTableCurrentVersion);
    }

    auto reopened = store_->open(dir_->file("rules.db"));
    ASSERT_TRUE(reopened) << reopened.error().to_string();
    EXPECT_EQ(store_->current_version(), kRuleTableCurrentVersion);
    EXPECT_EQ(Count(), 1);
}

TEST_F(RuleStoreTest, RowFailureRollsBackCleanupAndEarlierRows)
{
    Add({make_rule(kCertSha256, RuleType::Certificate, RuleState::Block)});
    store_->close();
    {
        SqliteDb db;
        ASSERT_TRUE(db.open(dir_->file("rules.db")));
        ASSERT_TRUE(db.exec("CREATE TRIGGER reject_team_rules BEFORE INSERT ON rules WHEN NEW.type = 4000 "
                            "BEGIN SELECT RAISE(ABORT, 'team rules disabled'); END"));
    }
    ASSERT_TRUE(store_->open(dir_->file("rules.db")));

    auto added = store_->add_rules({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
                                    make_rule(kTeamId, RuleType::TeamID, RuleState::Block)},
                                   RuleCleanup::All);
    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code(), ErrorCode::InsertOrReplaceRuleFailed);

    EXPECT_EQ(Count(), 1);
    RuleIdentifiers cert;
    cert.certificate_sha256 = kCertSha256;
    EXPECT_TRUE(Find(cert).has_value());
    RuleIdentifiers binary;
    binary.binary_sha256 = kBinarySha256;
    EXPECT_FALSE(Find(binary).has_value());
}

TEST_F(RuleStoreTest, AddBlockRuleScenario)
{
    const std::string id(64, 'A');
    Add({make_rule(id, RuleType::Binary, RuleState::Block)});
    EXPECT_EQ(Count(), 1);

    RuleIdentifiers ids;
    ids.binary_sha256 = id;
    auto rule = Find(ids);
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->type, RuleType::Binary);
    EXPECT_EQ(rule->state, RuleState::Block);
    EXPECT_EQ(rule->identifier, std::string(64, 'a'));

    RuleIdentifiers other;
    other.binary_sha256 = "other";
    EXPECT_FALSE(Find(other).has_value());
}

TEST_F(RuleStoreTest, EmptyBatchRequiresCleanup)
{
    auto rejected = store_->add_rules({}, RuleCleanup::None);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code(), ErrorCode::EmptyRuleArray);

    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block)});
    Add({}, RuleCleanup::All);
    EXPECT_EQ(Count(), 0);
}

TEST_F(RuleStoreTest, InvalidRecordRejectsWholeBatch)
{
    Add({make_rule(kCertSha256, RuleType::Certificate, RuleState::Allow)});

    const std::vector<std::vector<Rule>> batches = {
        {make_rule(kBinarySha256, RuleType::Binary, RuleState::Block), make_rule("", RuleType::Binary, RuleState::Block)},
        {make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
         make_rule(kTeamId, RuleType::Unknown, RuleState::Block)},
        {make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
         make_rule(kTeamId, RuleType::TeamID, RuleState::Unknown)},
    };
    for (const auto& batch : batches) {
        auto result = store_->add_rules(batch, RuleCleanup::All);
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code(), ErrorCode::RuleInvalid);
        EXPECT_EQ(Count(), 1);
    }

    auto cel = store_->add_rules({make_rule(kBinarySha256, RuleType::Binary, RuleState::CEL, "")}, RuleCleanup::None);
    ASSERT_FALSE(cel);
    EXPECT_EQ(cel.error().code(), ErrorCode::RuleInvalidExpression);
    EXPECT_EQ(Count(), 1);
}

TEST_F(RuleStoreTest, DuplicatesInBatchCollapseLastWriteWins)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
         make_rule(kCertSha256, RuleType::Certificate, RuleState::Block),
         make_rule(kBinarySha256, RuleType::Binary, RuleState::Allow)});
    EXPECT_EQ(Count(), 2);

    RuleIdentifiers ids;
    ids.binary_sha256 = kBinarySha256;
    auto rule = Find(ids);
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->state, RuleState::Allow);
}

TEST_F(RuleStoreTest, CountGrowsByDistinctNewPairs)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block)});
    const int64_t before = Count();

    // One pair already present, two new, one duplicated within the batch.
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Allow),
         make_rule(kCertSha256, RuleType::Certificate, RuleState::Block),
         make_rule(kTeamId, RuleType::TeamID, RuleState::Block), make_rule(kTeamId, RuleType::TeamID, RuleState::Allow)});
    EXPECT_EQ(Count(), before + 2);
}

TEST_F(RuleStoreTest, CleanupAllLeavesOnlyTheBatch)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
         make_rule(kCertSha256, RuleType::Certificate, RuleState::Allow),
         make_rule(kSigningId, RuleType::SigningID, RuleState::Block),
         make_rule(kCDHash, RuleType::CDHash, RuleState::Block),
         make_rule(kTransitiveSha256, RuleType::Binary, RuleState::AllowTransitive)});
    ASSERT_EQ(Count(), 5);

    Add({make_rule("TEAM123456", RuleType::TeamID, RuleState::Block)}, RuleCleanup::All);
    EXPECT_EQ(Count(), 1);
}

TEST_F(RuleStoreTest, CleanupNonTransitiveKeepsTransitiveRows)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
         make_rule(kCertSha256, RuleType::Certificate, RuleState::Allow),
         make_rule(kTransitiveSha256, RuleType::Binary, RuleState::AllowTransitive)});

    Add({make_rule(kTeamId, RuleType::TeamID, RuleState::Block)}, RuleCleanup::NonTransitive);
    EXPECT_EQ(Count(), 2);

    auto transitive = store_->transitive_rule_count();
    ASSERT_TRUE(transitive);
    EXPECT_EQ(*transitive, 1);

    RuleIdentifiers ids;
    ids.binary_sha256 = kBinarySha256;
    EXPECT_FALSE(Find(ids).has_value());
}

TEST_F(RuleStoreTest, RemoveRuleDeletesByIdentifierAndType)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
         make_rule(kCertSha256, RuleType::Certificate, RuleState::Block)});
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Remove)});
    EXPECT_EQ(Count(), 1);

    auto certs = store_->certificate_rule_count();
    ASSERT_TRUE(certs);
    EXPECT_EQ(*certs, 1);
}

TEST_F(RuleStoreTest, ResolutionFollowsPrecedence)
{
    Add({make_rule(kTeamId, RuleType::TeamID, RuleState::Block),
         make_rule(kCertSha256, RuleType::Certificate, RuleState::Allow),
         make_rule(kSigningId, RuleType::SigningID, RuleState::Block),
         make_rule(kBinarySha256, RuleType::Binary, RuleState::Allow),
         make_rule(kCDHash, RuleType::CDHash, RuleState::Block)});

    const std::vector<std::pair<RuleType, std::string>> order = {
        {RuleType::CDHash, kCDHash},
        {RuleType::Binary, kBinarySha256},
        {RuleType::SigningID, kSigningId},
        {RuleType::Certificate, kCertSha256},
        {RuleType::TeamID, kTeamId},
    };
    for (const auto& [type, identifier] : order) {
        auto rule = Find(AllIdentifiers());
        ASSERT_TRUE(rule.has_value());
        EXPECT_EQ(rule->type, type);
        EXPECT_EQ(rule->identifier, identifier);

        auto again = Find(AllIdentifiers());
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ(*again, *rule);

        Add({make_rule(identifier, type, RuleState::Remove)});
    }
    EXPECT_FALSE(Find(AllIdentifiers()).has_value());
}

TEST_F(RuleStoreTest, IdentifiersOnlyMatchTheirOwnType)
{
    // A team ID stored as a certificate identifier must not match the team probe.
    Add({make_rule(kTeamId, RuleType::Certificate, RuleState::Block)});

    RuleIdentifiers ids;
    ids.team_id = kTeamId;
    EXPECT_FALSE(Find(ids).has_value());
}

TEST_F(RuleStoreTest, EmptyIdentifiersNeverMatch)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block)});

    RuleIdentifiers ids;
    ids.cdhash = "";
    ids.binary_sha256 = "";
    ids.signing_id = "";
    ids.certificate_sha256 = "";
    ids.team_id = "";
    EXPECT_FALSE(Find(ids).has_value());
    EXPECT_FALSE(Find(RuleIdentifiers{}).has_value());
}

TEST_F(RuleStoreTest, CountsByTypeAndState)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
         make_rule(kTransitiveSha256, RuleType::Binary, RuleState::AllowTransitive),
         make_rule(std::string(64, 'c'), RuleType::Binary, RuleState::AllowCompiler),
         make_rule(kCertSha256, RuleType::Certificate, RuleState::Allow),
         make_rule(kTeamId, RuleType::TeamID, RuleState::Block),
         make_rule(kSigningId, RuleType::SigningID, RuleState::Block),
         make_rule(test::kPlatformSigningId, RuleType::SigningID, RuleState::Allow),
         make_rule(kCDHash, RuleType::CDHash, RuleState::Block)});

    auto counts = store_->rule_counts();
    ASSERT_TRUE(counts) << counts.error().to_string();
    EXPECT_EQ(counts->total, 8);
    EXPECT_EQ(counts->binary, 3);
    EXPECT_EQ(counts->certificate, 1);
    EXPECT_EQ(counts->teamid, 1);
    EXPECT_EQ(counts->signingid, 2);
    EXPECT_EQ(counts->cdhash, 1);
    EXPECT_EQ(counts->compiler, 1);
    EXPECT_EQ(counts->transitive, 1);

    auto compiler = store_->compiler_rule_count();
    ASSERT_TRUE(compiler);
    EXPECT_EQ(*compiler, 1);
    auto signing = store_->signingid_rule_count();
    ASSERT_TRUE(signing);
    EXPECT_EQ(*signing, 2);
}

TEST_F(RuleStoreTest, RetrieveAllRulesKeepsEveryField)
{
    Rule cel = make_rule(kBinarySha256, RuleType::Binary, RuleState::CEL, "target.signing_time >= timestamp(0)");
    cel.custom_msg = "blocked by policy";
    cel.custom_url = "https://example.com/why";
    cel.comment = "added in test";
    cel.timestamp = 1234;
    Rule block = make_rule(kCertSha256, RuleType::Certificate, RuleState::Block);

    Add({cel, block});

    auto rules = store_->retrieve_all_rules();
    ASSERT_TRUE(rules) << rules.error().to_string();
    ASSERT_EQ(rules->size(), 2u);
    EXPECT_EQ((*rules)[0], cel);
    EXPECT_EQ((*rules)[1].identifier, kCertSha256);
    EXPECT_EQ((*rules)[1].expression, "");
    EXPECT_EQ((*rules)[1].timestamp, *now_);
}

TEST_F(RuleStoreTest, NonCelRulesDropTheirExpression)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block, "true")});

    auto rules = store_->retrieve_all_rules();
    ASSERT_TRUE(rules);
    ASSERT_EQ(rules->size(), 1u);
    EXPECT_TRUE((*rules)[0].expression.empty());
}

TEST_F(RuleStoreTest, ResetTimestampTouchesOnlyThatRule)
{
    Rule transitive = make_rule(kTransitiveSha256, RuleType::Binary, RuleState::AllowTransitive);
    transitive.timestamp = 10;
    Rule other = make_rule(kBinarySha256, RuleType::Binary, RuleState::Block);
    other.timestamp = 20;
    Add({transitive, other});

    *now_ = 900000000;
    store_->reset_timestamp(transitive);

    auto rules = store_->retrieve_all_rules();
    ASSERT_TRUE(rules);
    ASSERT_EQ(rules->size(), 2u);
    EXPECT_EQ((*rules)[0].timestamp, 900000000);
    EXPECT_EQ((*rules)[1].timestamp, 20);
}

TEST_F(RuleStoreTest, HasRuleTreatsEmptyAndAbsentExpressionAlike)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
         make_rule(kCertSha256, RuleType::Certificate, RuleState::CEL, "true")});

    auto block = store_->has_rule(kBinarySha256, RuleType::Binary, RuleState::Block, "");
    ASSERT_TRUE(block);
    EXPECT_TRUE(*block);

    auto wrong_state = store_->has_rule(kBinarySha256, RuleType::Binary, RuleState::SilentBlock, "");
    ASSERT_TRUE(wrong_state);
    EXPECT_FALSE(*wrong_state);

    auto same_expr = store_->has_rule(kCertSha256, RuleType::Certificate, RuleState::CEL, "true");
    ASSERT_TRUE(same_expr);
    EXPECT_TRUE(*same_expr);

    auto other_expr = store_->has_rule(kCertSha256, RuleType::Certificate, RuleState::CEL, "false");
    ASSERT_TRUE(other_expr);
    EXPECT_FALSE(*other_expr);
}

TEST_F(RuleStoreTest, HasCompilerRuleIgnoresCertificateAndTeamRows)
{
    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::AllowCompiler),
         make_rule(kTeamId, RuleType::TeamID, RuleState::AllowCompiler)});

    auto binary = store_->has_compiler_rule(kBinarySha256);
    ASSERT_TRUE(binary);
    EXPECT_TRUE(*binary);

    auto team = store_->has_compiler_rule(kTeamId);
    ASSERT_TRUE(team);
    EXPECT_FALSE(*team);
}

TEST_F(RuleStoreTest, DigestTracksNonTransitiveContent)
{
    auto empty = store_->rules_digest();
    ASSERT_TRUE(empty);
    EXPECT_EQ(*empty, "2d06800538d394c2");

    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block)});
    auto one = store_->rules_digest();
    ASSERT_TRUE(one);
    EXPECT_NE(*one, *empty);
    EXPECT_EQ(one->size(), 16u);

    Add({make_rule(kTransitiveSha256, RuleType::Binary, RuleState::AllowTransitive)});
    auto with_transitive = store_->rules_digest();
    ASSERT_TRUE(with_transitive);
    EXPECT_EQ(*with_transitive, *one);

    Add({make_rule(kBinarySha256, RuleType::Binary, RuleState::Allow)});
    auto changed = store_->rules_digest();
    ASSERT_TRUE(changed);
    EXPECT_NE(*changed, *one);
}

TEST_F(RuleStoreTest, DigestIsStableAcrossStoresWithSameContent)
{
    const std::vector<Rule> rules = {make_rule(kBinarySha256, RuleType::Binary, RuleState::Block),
                                     make_rule(kCertSha256, RuleType::Certificate, RuleState::CEL, "false")};
    Add(rules);

    RuleStore other;
    ASSERT_TRUE(other.open(dir_->file("other.db")));
    ASSERT_TRUE(other.add_rules(rules, RuleCleanup::None));

    auto a = store_->rules_digest();
    auto b = other.rules_digest();
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(*a, *b);
}

TEST(RuleStoreMigrationTest, VersionOneDatabaseIsUpgraded)
{
    test::TempDir dir("binauthz_rule_store_migration");
    const std::string path = dir.file("rules.db");
    {
        SqliteDb db;
        ASSERT_TRUE(db.open(path));
        ASSERT_TRUE(db.exec("CREATE TABLE rules (shasum TEXT NOT NULL, state INTEGER NOT NULL, "
                            "type INTEGER NOT NULL, custommsg TEXT)"));
        ASSERT_TRUE(db.exec("CREATE UNIQUE INDEX rulesunique ON rules (shasum, type)"));
        ASSERT_TRUE(db.exec("INSERT INTO rules VALUES ('" + to_upper(kBinarySha256) + "', 2, 1, 'legacy block')"));
        ASSERT_TRUE(db.exec("INSERT INTO rules VALUES ('" + to_upper(kCertSha256) + "', 1, 2, NULL)"));
        ASSERT_TRUE(db.exec("INSERT INTO rules VALUES ('abcdefghij', 2, 3, NULL)"));
        ASSERT_TRUE(db.exec("INSERT INTO rules VALUES ('ABCDEFGHIJ:signingID', 1, 4, NULL)"));
        ASSERT_TRUE(db.set_user_version(1));
    }

    RuleStore store;
    auto opened = store.open(path);
    ASSERT_TRUE(opened) << opened.error().to_string();
    EXPECT_EQ(store.current_version(), kRuleTableCurrentVersion);
    EXPECT_FALSE(store.clean_sync_required());

    auto rules = store.retrieve_all_rules();
    ASSERT_TRUE(rules) << rules.error().to_string();
    ASSERT_EQ(rules->size(), 4u);

    EXPECT_EQ((*rules)[0].identifier, kBinarySha256);
    EXPECT_EQ((*rules)[0].type, RuleType::Binary);
    EXPECT_EQ((*rules)[0].state, RuleState::Block);
    EXPECT_EQ((*rules)[0].custom_msg, "legacy block");

    EXPECT_EQ((*rules)[1].identifier, kCertSha256);
    EXPECT_EQ((*rules)[1].type, RuleType::Certificate);

    EXPECT_EQ((*rules)[2].identifier, "ABCDEFGHIJ");
    EXPECT_EQ((*rules)[2].type, RuleType::TeamID);

    EXPECT_EQ((*rules)[3].identifier, "ABCDEFGHIJ:signingID");
    EXPECT_EQ((*rules)[3].type, RuleType::SigningID);
    EXPECT_TRUE((*rules)[3].expression.empty());
    EXPECT_TRUE((*rules)[3].custom_url.empty());
}

TEST(RuleStoreMigrationTest, NewerDatabaseIsRejected)
{
    test::TempDir dir("binauthz_rule_store_newer");
    const std::string path = dir.file("rules.db");
    {
        SqliteDb db;
        ASSERT_TRUE(db.open(path));
        ASSERT_TRUE(db.set_user_version(kRuleTableCurrentVersion + 1));
    }

    RuleStore store;
    auto opened = store.open(path);
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code(), ErrorCode::MigrationFailed);
    EXPECT_FALSE(store.is_open());
}

TEST(RuleStoreFailureTest, CorruptFileFailsWithoutCrashing)
{
    test::TempDir dir("binauthz_rule_store_corrupt");
    const std::string corrupt = dir.write("rules.db", std::string(8192, 'x'));

    RuleStore store;
    auto opened = store.open(corrupt);
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code(), ErrorCode::DatabaseOpenFailed);

    auto count = store.rule_count();
    ASSERT_FALSE(count);
    EXPECT_EQ(count.error().code(), ErrorCode::DatabaseUnavailable);

    auto added = store.add_rules({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block)}, RuleCleanup::None);
    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code(), ErrorCode::DatabaseUnavailable);

    RuleIdentifiers ids;
    ids.binary_sha256 = kBinarySha256;
    EXPECT_FALSE(store.find_rule(ids));

    // A fresh file resumes normal operation.
    ASSERT_TRUE(store.open(dir.file("fresh.db")));
    ASSERT_TRUE(store.add_rules({make_rule(kBinarySha256, RuleType::Binary, RuleState::Block)}, RuleCleanup::None));
    auto recovered = store.rule_count();
    ASSERT_TRUE(recovered);
    EXPECT_EQ(*recovered, 1);
}

} // namespace
} // namespace binauthz
