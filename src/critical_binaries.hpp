// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "result.hpp"

namespace binauthz {

enum class SigningStatus {
    Unsigned,
    Invalid,
    Development,
    Production,
};

const char* signing_status_name(SigningStatus status);

// Code-signing facts about one executable, as reported by a CodeSigningInspector.
struct SigningInfo {
    std::string signing_id;
    std::string team_id;
    std::string cdhash;
    bool platform_binary = false;
    // SHA-256 of each certificate, leaf first.
    std::vector<std::string> cert_chain;
    std::string leaf_common_name;
    int64_t signing_time = 0;
    int64_t secure_signing_time = 0;
    SigningStatus status = SigningStatus::Unsigned;

    [[nodiscard]] std::string leaf_certificate() const { return cert_chain.empty() ? std::string() : cert_chain[0]; }
};

// Both chains present and identical.
bool signing_information_matches(const SigningInfo& a, const SigningInfo& b);

// "TEAMID:signing.id", "platform:signing.id" for platform binaries without a
// team, nullopt when no signing ID can be formed.
std::optional<std::string> format_signing_id(const SigningInfo& info);

// Signature extraction lives outside this library.
class CodeSigningInspector {
  public:
    virtual ~CodeSigningInspector() = default;

    virtual Result<SigningInfo> inspect_path(const std::string& path) = 0;
    // The running agent.
    virtual Result<SigningInfo> inspect_self() = 0;
    // The process launcher, pid 1.
    virtual Result<SigningInfo> inspect_launcher() = 0;
    // Paths the platform already treats as too critical to intercept. May be empty.
    virtual std::vector<std::string> default_muted_paths() = 0;
};

enum class CachedDecisionKind {
    AllowBinary,
    AllowSigningID,
};

struct CachedDecision {
    CachedDecisionKind decision = CachedDecisionKind::AllowSigningID;
    std::string decision_extra;
    std::string sha256;
    std::string signing_id;
    std::string cdhash;
    std::string team_id;
    std::string cert_sha256;
    std::string cert_common_name;
    SigningStatus signing_status = SigningStatus::Unsigned;
    int64_t signing_time = 0;
    int64_t secure_signing_time = 0;
};

// Hardcoded in case the inspector cannot report the platform's mute set.
const std::vector<std::string>& fallback_muted_paths();
// Agent components and loader paths checked in addition to the mute set.
const std::vector<std::string>& agent_critical_paths();

// Sorted union of the fallback set, the agent list and the inspector's mute set.
std::vector<std::string> critical_binary_paths(CodeSigningInspector& inspector);

struct TrustAnchorSnapshot {
    std::unordered_map<std::string, CachedDecision> by_sha256;
    std::unordered_map<std::string, CachedDecision> by_signing_id;
    std::string launcher_leaf_certificate;
};

/**
 * Always-allow decisions for binaries the system cannot run without.
 *
 * A candidate path is trusted when it can be hashed and its signing chain
 * matches the launcher's, or its team ID matches the agent's own. Anything
 * else is logged and skipped. Each trusted binary is reachable by SHA-256 and,
 * when it has one, by formatted signing ID. The set is computed once and
 * never edited in place.
 */
class CriticalBinaryTrustAnchor {
  public:
    CriticalBinaryTrustAnchor();

    // Returns the number of binaries trusted.
    size_t initialize(CodeSigningInspector& inspector, const std::vector<std::string>& paths);

    [[nodiscard]] std::optional<CachedDecision> lookup(const std::string& sha256, const std::string& signing_id) const;
    [[nodiscard]] std::string launcher_leaf_certificate() const;
    [[nodiscard]] std::shared_ptr<const TrustAnchorSnapshot> snapshot() const;
    [[nodiscard]] size_t size() const;

  private:
    mutable std::mutex mu_;
    std::shared_ptr<const TrustAnchorSnapshot> snapshot_;
};

} // namespace binauthz
