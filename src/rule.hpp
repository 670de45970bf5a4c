// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>

#include "result.hpp"
#include "types.hpp"

namespace binauthz {

const char* rule_type_name(RuleType type);
const char* rule_state_name(RuleState state);

// Sync-protocol spellings: "BINARY", "CDHASH", ... and "ALLOWLIST", "BLOCKLIST", ...
bool parse_rule_type(const std::string& value, RuleType& type);
bool parse_rule_policy(const std::string& value, RuleState& state);

// Map raw integers read back from storage; unrecognized values become Unknown.
RuleType rule_type_from_int(int64_t value);
RuleState rule_state_from_int(int64_t value);

// Seconds since 2001-01-01T00:00:00Z.
int64_t rule_timestamp_now();

std::string normalize_identifier(RuleType type, const std::string& identifier);
RuleIdentifiers normalize_identifiers(const RuleIdentifiers& identifiers);

/**
 * Structural validation of a single rule.
 *
 * Rejects empty identifiers, Unknown state or type, and CEL rules without an
 * expression. On success returns a copy with the identifier normalized for its
 * type and the expression cleared for non-CEL states. Expression compilation
 * is the caller's concern.
 */
Result<Rule> validate_rule(const Rule& rule);

Result<Rule> rule_from_dictionary(const RuleDictionary& dict);

std::string describe_rule(const Rule& rule);

} // namespace binauthz
