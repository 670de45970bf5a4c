// cppcheck-suppress-file missingIncludeSystem
#include "rule.hpp"

#include <chrono>

#include "utils.hpp"

namespace binauthz {

const char* rule_type_name(RuleType type)
{
    switch (type) {
        case RuleType::CDHash:
            return "CDHASH";
        case RuleType::Binary:
            return "BINARY";
        case RuleType::SigningID:
            return "SIGNINGID";
        case RuleType::Certificate:
            return "CERTIFICATE";
        case RuleType::TeamID:
            return "TEAMID";
        case RuleType::Unknown:
            break;
    }
    return "UNKNOWN";
}

const char* rule_state_name(RuleState state)
{
    switch (state) {
        case RuleState::Allow:
            return "ALLOWLIST";
        case RuleState::Block:
            return "BLOCKLIST";
        case RuleState::SilentBlock:
            return "SILENT_BLOCKLIST";
        case RuleState::Remove:
            return "REMOVE";
        case RuleState::AllowCompiler:
            return "ALLOWLIST_COMPILER";
        case RuleState::AllowTransitive:
            return "ALLOWLIST_TRANSITIVE";
        case RuleState::AllowLocalBinary:
            return "ALLOWLIST_LOCAL_BINARY";
        case RuleState::AllowLocalSigningID:
            return "ALLOWLIST_LOCAL_SIGNINGID";
        case RuleState::CEL:
            return "CEL";
        case RuleState::Unknown:
            break;
    }
    return "UNKNOWN";
}

bool parse_rule_type(const std::string& value, RuleType& type)
{
    const std::string v = to_upper(trim(value));
    if (v == "BINARY") {
        type = RuleType::Binary;
    } else if (v == "CERTIFICATE") {
        type = RuleType::Certificate;
    } else if (v == "TEAMID") {
        type = RuleType::TeamID;
    } else if (v == "SIGNINGID") {
        type = RuleType::SigningID;
    } else if (v == "CDHASH") {
        type = RuleType::CDHash;
    } else {
        return false;
    }
    return true;
}

bool parse_rule_policy(const std::string& value, RuleState& state)
{
    const std::string v = to_upper(trim(value));
    if (v == "ALLOWLIST" || v == "WHITELIST") {
        state = RuleState::Allow;
    } else if (v == "ALLOWLIST_COMPILER" || v == "WHITELIST_COMPILER") {
        state = RuleState::AllowCompiler;
    } else if (v == "ALLOWLIST_LOCAL_BINARY") {
        state = RuleState::AllowLocalBinary;
    } else if (v == "ALLOWLIST_LOCAL_SIGNINGID") {
        state = RuleState::AllowLocalSigningID;
    } else if (v == "BLOCKLIST" || v == "BLACKLIST") {
        state = RuleState::Block;
    } else if (v == "SILENT_BLOCKLIST" || v == "SILENT_BLACKLIST") {
        state = RuleState::SilentBlock;
    } else if (v == "REMOVE") {
        state = RuleState::Remove;
    } else if (v == "CEL") {
        state = RuleState::CEL;
    } else {
        return false;
    }
    return true;
}

RuleType rule_type_from_int(int64_t value)
{
    switch (value) {
        case static_cast<int64_t>(RuleType::CDHash):
        case static_cast<int64_t>(RuleType::Binary):
        case static_cast<int64_t>(RuleType::SigningID):
        case static_cast<int64_t>(RuleType::Certificate):
        case static_cast<int64_t>(RuleType::TeamID):
            return static_cast<RuleType>(value);
        default:
            return RuleType::Unknown;
    }
}

RuleState rule_state_from_int(int64_t value)
{
    if (value < static_cast<int64_t>(RuleState::Allow) || value > static_cast<int64_t>(RuleState::CEL)) {
        return RuleState::Unknown;
    }
    return static_cast<RuleState>(value);
}

int64_t rule_timestamp_now()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(now).count() - kRuleTimestampEpochOffset;
}

std::string normalize_identifier(RuleType type, const std::string& identifier)
{
    switch (type) {
        case RuleType::Binary:
        case RuleType::Certificate:
        case RuleType::CDHash:
            return to_lower(identifier);
        case RuleType::TeamID:
            return to_upper(identifier);
        case RuleType::SigningID: {
            size_t colon = identifier.find(':');
            if (colon == std::string::npos) {
                return identifier;
            }
            std::string prefix = identifier.substr(0, colon);
            prefix = to_lower(prefix) == "platform" ? "platform" : to_upper(prefix);
            return prefix + identifier.substr(colon);
        }
        case RuleType::Unknown:
            break;
    }
    return identifier;
}

RuleIdentifiers normalize_identifiers(const RuleIdentifiers& identifiers)
{
    auto normalize = [](RuleType type, const std::optional<std::string>& value) -> std::optional<std::string> {
        if (!value || value->empty()) {
            return std::nullopt;
        }
        return normalize_identifier(type, *value);
    };

    RuleIdentifiers out;
    out.cdhash = normalize(RuleType::CDHash, identifiers.cdhash);
    out.binary_sha256 = normalize(RuleType::Binary, identifiers.binary_sha256);
    out.signing_id = normalize(RuleType::SigningID, identifiers.signing_id);
    out.certificate_sha256 = normalize(RuleType::Certificate, identifiers.certificate_sha256);
    out.team_id = normalize(RuleType::TeamID, identifiers.team_id);
    return out;
}

Result<Rule> validate_rule(const Rule& rule)
{
    if (trim(rule.identifier).empty()) {
        return Error(ErrorCode::RuleInvalid, "Rule has an empty identifier");
    }
    if (rule.type == RuleType::Unknown) {
        return Error(ErrorCode::RuleInvalid, "Rule has an unknown type", rule.identifier);
    }
    if (rule.state == RuleState::Unknown) {
        return Error(ErrorCode::RuleInvalid, "Rule has an unknown state", rule.identifier);
    }
    if (rule.state == RuleState::CEL && trim(rule.expression).empty()) {
        return Error(ErrorCode::RuleInvalidExpression, "CEL rule has no expression", rule.identifier);
    }

    Rule out = rule;
    out.identifier = normalize_identifier(rule.type, trim(rule.identifier));
    if (out.state != RuleState::CEL) {
        out.expression.clear();
    }
    return out;
}

Result<Rule> rule_from_dictionary(const RuleDictionary& dict)
{
    auto lookup = [&dict](const char* key) -> std::string {
        auto it = dict.find(key);
        return it == dict.end() ? std::string() : it->second;
    };

    Rule rule;
    rule.identifier = lookup("identifier");
    if (rule.identifier.empty()) {
        rule.identifier = lookup("sha256");
    }

    const std::string policy = lookup("policy");
    if (!parse_rule_policy(policy, rule.state)) {
        return Error(ErrorCode::RuleInvalid, "Unknown rule policy", policy);
    }

    const std::string type = lookup("rule_type");
    if (!parse_rule_type(type, rule.type)) {
        return Error(ErrorCode::RuleInvalid, "Unknown rule type", type);
    }

    rule.custom_msg = lookup("custom_msg");
    rule.custom_url = lookup("custom_url");
    rule.comment = lookup("comment");
    rule.expression = lookup("cel_expr");

    return validate_rule(rule);
}

std::string describe_rule(const Rule& rule)
{
    return std::string(rule_type_name(rule.type)) + ":" + rule.identifier + " " + rule_state_name(rule.state);
}

} // namespace binauthz
