// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "result.hpp"
#include "types.hpp"

namespace binauthz {

/**
 * Streaming XXH3-64 hasher over the rule fields that matter for drift
 * detection: identifier, expression, state and type.
 *
 * Integers are fed as 4 little-endian bytes so the digest does not depend on
 * host byte order.
 */
class RulesDigestBuilder {
  public:
    RulesDigestBuilder();

    void update(const void* data, size_t len);
    void update(const std::string& text) { update(text.data(), text.size()); }
    void update_i32(int32_t value);

    void add_rule(const std::string& identifier, const std::string& expression, RuleState state, RuleType type);

    [[nodiscard]] size_t rules() const { return rules_; }

    // Fails if the hash state could not be allocated or fed.
    [[nodiscard]] Result<uint64_t> value() const;
    // 16 lowercase hex characters.
    [[nodiscard]] Result<std::string> hex() const;

  private:
    struct StateDeleter {
        void operator()(XXH3_state_t* state) const { XXH3_freeState(state); }
    };

    std::unique_ptr<XXH3_state_t, StateDeleter> state_;
    bool ok_ = false;
    size_t rules_ = 0;
};

} // namespace binauthz
