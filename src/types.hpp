#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace binauthz {

inline constexpr const char* kRulesDbPath = "/var/lib/binauthz/rules.db";

inline constexpr uint32_t kRuleTableCurrentVersion = 9;

// Seconds between the Unix epoch and 2001-01-01T00:00:00Z, the epoch rule
// timestamps are stored against.
inline constexpr int64_t kRuleTimestampEpochOffset = 978307200;

// Transitive rule culling defaults.
inline constexpr int64_t kTransitiveRuleCullingThreshold = 500000;
inline constexpr int64_t kTransitiveRuleExpirationSeconds = 6LL * 30 * 24 * 3600;
inline constexpr int64_t kTransitiveRuleCullingIntervalSeconds = 3600;

// Once a batch carries this many non-allow rules the decision cache is
// flushed without looking at the store.
inline constexpr uint64_t kFlushNonAllowRuleThreshold = 1000;

// The numeric value doubles as the precedence rank: lower wins.
enum class RuleType : int32_t {
    Unknown = 0,
    CDHash = 500,
    Binary = 1000,
    SigningID = 2000,
    Certificate = 3000,
    TeamID = 4000,
};

enum class RuleState : int32_t {
    Unknown = 0,
    Allow = 1,
    Block = 2,
    SilentBlock = 3,
    Remove = 4,
    AllowCompiler = 5,
    AllowTransitive = 6,
    AllowLocalBinary = 7,
    AllowLocalSigningID = 8,
    CEL = 9,
};

enum class RuleCleanup {
    None,
    All,
    NonTransitive,
};

struct Rule {
    std::string identifier;
    RuleType type = RuleType::Unknown;
    RuleState state = RuleState::Unknown;
    std::string custom_msg;
    std::string custom_url;
    std::string comment;
    std::string expression;
    int64_t timestamp = 0;

    bool operator==(const Rule& other) const
    {
        return identifier == other.identifier && type == other.type && state == other.state &&
               custom_msg == other.custom_msg && custom_url == other.custom_url && comment == other.comment &&
               expression == other.expression && timestamp == other.timestamp;
    }
};

struct RuleIdentifiers {
    std::optional<std::string> cdhash;
    std::optional<std::string> binary_sha256;
    std::optional<std::string> signing_id;
    std::optional<std::string> certificate_sha256;
    std::optional<std::string> team_id;
};

struct RuleCounts {
    int64_t total = 0;
    int64_t binary = 0;
    int64_t certificate = 0;
    int64_t compiler = 0;
    int64_t transitive = 0;
    int64_t teamid = 0;
    int64_t signingid = 0;
    int64_t cdhash = 0;
};

// One static rule as handed over by configuration: sync-protocol keys to values.
using RuleDictionary = std::map<std::string, std::string>;

struct PolicyIssues {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool has_errors() const { return !errors.empty(); }
};

} // namespace binauthz
