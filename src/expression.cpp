// cppcheck-suppress-file missingIncludeSystem
#include "expression.hpp"

#include "logging.hpp"
#include "utils.hpp"

namespace binauthz {

namespace {

constexpr size_t kMaxCachedPrograms = 1024;

} // namespace

ExpressionEvaluator::ExpressionEvaluator(std::shared_ptr<ExpressionEngine> engine) : engine_(std::move(engine)) {}

size_t ExpressionEvaluator::cached_programs() const
{
    std::lock_guard<std::mutex> lock(cache_mu_);
    return cache_.size();
}

Result<std::shared_ptr<const CompiledExpression>> ExpressionEvaluator::compile_cached(const std::string& source)
{
    {
        std::lock_guard<std::mutex> lock(cache_mu_);
        auto it = cache_.find(source);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    auto compiled = engine_->compile(source);
    if (!compiled) {
        return compiled.error();
    }
    if (!*compiled) {
        return Error(ErrorCode::ExpressionCompileFailed, "Expression engine returned no program", source);
    }

    std::lock_guard<std::mutex> lock(cache_mu_);
    if (cache_.size() >= kMaxCachedPrograms) {
        cache_.clear();
    }
    cache_.emplace(source, *compiled);
    return *compiled;
}

Result<void> ExpressionEvaluator::validate(const std::string& source)
{
    if (trim(source).empty()) {
        return Error(ErrorCode::RuleInvalidExpression, "Expression is empty");
    }
    if (!engine_) {
        return {};
    }
    auto compiled = compile_cached(source);
    if (!compiled) {
        return Error(ErrorCode::RuleInvalidExpression, "Expression failed to compile", compiled.error().to_string());
    }
    return {};
}

RuleState ExpressionEvaluator::evaluate(const std::string& source, const EvaluationContext& context)
{
    if (!engine_) {
        logger().log(SLOG_WARN("No expression engine configured; blocking").field("path", context.path));
        return RuleState::Block;
    }

    auto compiled = compile_cached(source);
    if (!compiled) {
        logger().log(SLOG_ERROR("Expression compile failed; blocking")
                         .field("path", context.path)
                         .field("error", compiled.error().to_string()));
        return RuleState::Block;
    }

    auto result = engine_->evaluate(**compiled, context);
    if (!result) {
        logger().log(SLOG_ERROR("Expression evaluation failed; blocking")
                         .field("path", context.path)
                         .field("error", result.error().to_string()));
        return RuleState::Block;
    }
    return *result ? RuleState::Allow : RuleState::Block;
}

} // namespace binauthz
