// cppcheck-suppress-file missingIncludeSystem
#include "critical_binaries.hpp"

#include <set>

#include "logging.hpp"
#include "sha256.hpp"

namespace binauthz {

const char* signing_status_name(SigningStatus status)
{
    switch (status) {
        case SigningStatus::Unsigned:
            return "unsigned";
        case SigningStatus::Invalid:
            return "invalid";
        case SigningStatus::Development:
            return "development";
        case SigningStatus::Production:
            return "production";
    }
    return "unsigned";
}

bool signing_information_matches(const SigningInfo& a, const SigningInfo& b)
{
    return !a.cert_chain.empty() && a.cert_chain == b.cert_chain;
}

std::optional<std::string> format_signing_id(const SigningInfo& info)
{
    if (info.signing_id.empty()) {
        return std::nullopt;
    }
    if (info.team_id.empty()) {
        if (info.platform_binary) {
            return "platform:" + info.signing_id;
        }
        logger().log(SLOG_DEBUG("Cannot format signing ID without team ID for non-platform binary")
                         .field("signing_id", info.signing_id));
        return std::nullopt;
    }
    return info.team_id + ":" + info.signing_id;
}

const std::vector<std::string>& fallback_muted_paths()
{
    static const std::vector<std::string> paths = {
        "/usr/lib/systemd/systemd",
        "/usr/lib/systemd/systemd-journald",
        "/usr/lib/systemd/systemd-logind",
        "/usr/lib/systemd/systemd-udevd",
        "/usr/lib/systemd/systemd-executor",
        "/usr/bin/dbus-daemon",
        "/usr/bin/dbus-broker",
        "/usr/lib/polkit-1/polkitd",
        "/usr/sbin/auditd",
    };
    return paths;
}

const std::vector<std::string>& agent_critical_paths()
{
    static const std::vector<std::string> paths = {
        "/usr/lib64/ld-linux-x86-64.so.2",
        "/usr/lib/ld-linux-aarch64.so.1",
        "/usr/sbin/binauthzd",
        "/usr/bin/binauthzctl",
        "/usr/libexec/binauthz/binauthz-syncservice",
        "/usr/libexec/binauthz/binauthz-metricservice",
    };
    return paths;
}

std::vector<std::string> critical_binary_paths(CodeSigningInspector& inspector)
{
    std::set<std::string> paths(fallback_muted_paths().begin(), fallback_muted_paths().end());
    paths.insert(agent_critical_paths().begin(), agent_critical_paths().end());
    for (auto& path : inspector.default_muted_paths()) {
        if (!path.empty()) {
            paths.insert(std::move(path));
        }
    }
    return std::vector<std::string>(paths.begin(), paths.end());
}

CriticalBinaryTrustAnchor::CriticalBinaryTrustAnchor() : snapshot_(std::make_shared<const TrustAnchorSnapshot>()) {}

size_t CriticalBinaryTrustAnchor::initialize(CodeSigningInspector& inspector, const std::vector<std::string>& paths)
{
    auto next = std::make_shared<TrustAnchorSnapshot>();

    SigningInfo launcher;
    auto launcher_info = inspector.inspect_launcher();
    if (launcher_info) {
        launcher = *launcher_info;
        next->launcher_leaf_certificate = launcher.leaf_certificate();
    } else {
        logger().log(SLOG_WARN("Unable to read launcher signing information")
                         .field("error", launcher_info.error().to_string()));
    }

    SigningInfo self;
    auto self_info = inspector.inspect_self();
    if (self_info) {
        self = *self_info;
    } else {
        logger().log(SLOG_WARN("Unable to read agent signing information").field("error", self_info.error().to_string()));
    }

    size_t trusted = 0;
    for (const auto& path : paths) {
        std::string sha256;
        if (!sha256_file_hex(path, sha256)) {
            logger().log(SLOG_DEBUG("Unable to compute hash for critical binary").field("path", path));
            continue;
        }

        auto info = inspector.inspect_path(path);
        if (!info) {
            logger().log(SLOG_WARN("Unable to read signing information for critical binary")
                             .field("path", path)
                             .field("error", info.error().to_string()));
            continue;
        }

        const bool system_binary = signing_information_matches(*info, launcher);
        if (!system_binary && (self.team_id.empty() || info->team_id != self.team_id)) {
            logger().log(SLOG_WARN("Unable to validate critical binary")
                             .field("path", path)
                             .field("launcher_leaf", launcher.leaf_certificate())
                             .field("binary_leaf", info->leaf_certificate())
                             .field("agent_team_id", self.team_id)
                             .field("binary_team_id", info->team_id));
            continue;
        }

        CachedDecision cd;
        cd.decision_extra = system_binary ? "critical system binary" : "agent binary";
        cd.sha256 = sha256;
        cd.signing_id = format_signing_id(*info).value_or("");
        cd.cdhash = info->cdhash;
        cd.team_id = info->team_id.empty() && info->platform_binary ? "platform" : info->team_id;
        cd.cert_sha256 = info->leaf_certificate();
        cd.cert_common_name = info->leaf_common_name;
        cd.signing_status = info->status;
        cd.signing_time = info->signing_time;
        cd.secure_signing_time = info->secure_signing_time;

        CachedDecision by_hash = cd;
        by_hash.decision = CachedDecisionKind::AllowBinary;
        next->by_sha256[sha256] = by_hash;
        if (!cd.signing_id.empty()) {
            cd.decision = CachedDecisionKind::AllowSigningID;
            next->by_signing_id[cd.signing_id] = cd;
        }
        ++trusted;
    }

    logger().log(SLOG_INFO("Critical binaries loaded")
                     .field("candidates", static_cast<uint64_t>(paths.size()))
                     .field("trusted", static_cast<uint64_t>(trusted)));

    std::lock_guard<std::mutex> lock(mu_);
    snapshot_ = std::move(next);
    return trusted;
}

std::optional<CachedDecision> CriticalBinaryTrustAnchor::lookup(const std::string& sha256,
                                                               const std::string& signing_id) const
{
    auto snap = snapshot();
    if (!sha256.empty()) {
        auto it = snap->by_sha256.find(sha256);
        if (it != snap->by_sha256.end()) {
            return it->second;
        }
    }
    if (!signing_id.empty()) {
        auto it = snap->by_signing_id.find(signing_id);
        if (it != snap->by_signing_id.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::string CriticalBinaryTrustAnchor::launcher_leaf_certificate() const
{
    return snapshot()->launcher_leaf_certificate;
}

std::shared_ptr<const TrustAnchorSnapshot> CriticalBinaryTrustAnchor::snapshot() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return snapshot_;
}

size_t CriticalBinaryTrustAnchor::size() const
{
    return snapshot()->by_sha256.size();
}

} // namespace binauthz
