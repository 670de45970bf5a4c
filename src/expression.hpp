// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace binauthz {

// Decision-time attributes an expression may inspect.
struct EvaluationContext {
    std::string path;
    std::string signing_id;
    std::string team_id;
    int64_t signing_time = 0;
    int64_t secure_signing_time = 0;
    std::vector<std::string> args;
    std::map<std::string, std::string> envs;
    uint32_t euid = 0;
    std::string cwd;
};

// Opaque program produced by an ExpressionEngine. Engines subclass it.
class CompiledExpression {
  public:
    virtual ~CompiledExpression() = default;

    [[nodiscard]] virtual const std::string& source() const = 0;
};

/**
 * Capability boundary for the conditional-rule language runtime.
 *
 * The core only compiles sources at write time and evaluates programs at
 * decision time; grammar and standard library belong to the implementation.
 */
class ExpressionEngine {
  public:
    virtual ~ExpressionEngine() = default;

    virtual Result<std::shared_ptr<const CompiledExpression>> compile(const std::string& source) = 0;

    // true allows execution, false blocks it.
    virtual Result<bool> evaluate(const CompiledExpression& program, const EvaluationContext& context) = 0;
};

class ExpressionEvaluator {
  public:
    // A null engine accepts any non-empty source and evaluates everything to Block.
    explicit ExpressionEvaluator(std::shared_ptr<ExpressionEngine> engine = nullptr);

    ExpressionEvaluator(const ExpressionEvaluator&) = delete;
    ExpressionEvaluator& operator=(const ExpressionEvaluator&) = delete;

    Result<void> validate(const std::string& source);

    // Never fails: compile and runtime errors resolve to Block.
    RuleState evaluate(const std::string& source, const EvaluationContext& context);

    [[nodiscard]] bool has_engine() const { return engine_ != nullptr; }
    [[nodiscard]] size_t cached_programs() const;

  private:
    Result<std::shared_ptr<const CompiledExpression>> compile_cached(const std::string& source);

    std::shared_ptr<ExpressionEngine> engine_;
    mutable std::mutex cache_mu_;
    std::map<std::string, std::shared_ptr<const CompiledExpression>> cache_;
};

} // namespace binauthz
