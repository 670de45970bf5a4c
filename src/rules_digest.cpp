// cppcheck-suppress-file missingIncludeSystem
#include "rules_digest.hpp"

#include <cstdio>

namespace binauthz {

RulesDigestBuilder::RulesDigestBuilder() : state_(XXH3_createState())
{
    ok_ = state_ != nullptr && XXH3_64bits_reset(state_.get()) == XXH_OK;
}

void RulesDigestBuilder::update(const void* data, size_t len)
{
    if (!ok_ || len == 0) {
        return;
    }
    if (XXH3_64bits_update(state_.get(), data, len) != XXH_OK) {
        ok_ = false;
    }
}

void RulesDigestBuilder::update_i32(int32_t value)
{
    const auto v = static_cast<uint32_t>(value);
    const uint8_t bytes[4] = {static_cast<uint8_t>(v & 0xff), static_cast<uint8_t>((v >> 8) & 0xff),
                              static_cast<uint8_t>((v >> 16) & 0xff), static_cast<uint8_t>((v >> 24) & 0xff)};
    update(bytes, sizeof(bytes));
}

void RulesDigestBuilder::add_rule(const std::string& identifier, const std::string& expression, RuleState state,
                                  RuleType type)
{
    update(identifier);
    update(expression);
    update_i32(static_cast<int32_t>(state));
    update_i32(static_cast<int32_t>(type));
    ++rules_;
}

Result<uint64_t> RulesDigestBuilder::value() const
{
    if (!ok_) {
        return Error(ErrorCode::IoError, "Rules digest state unavailable");
    }
    return static_cast<uint64_t>(XXH3_64bits_digest(state_.get()));
}

Result<std::string> RulesDigestBuilder::hex() const
{
    auto digest = value();
    if (!digest) {
        return digest.error();
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(*digest));
    return std::string(buf);
}

} // namespace binauthz
