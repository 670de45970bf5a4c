// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace binauthz {

enum class ErrorCode {
    Unknown,
    InvalidArgument,
    IoError,
    ResourceNotFound,

    // Batch validation and mutation
    EmptyRuleArray,
    RuleInvalid,
    RuleInvalidExpression,
    RemoveRuleFailed,
    InsertOrReplaceRuleFailed,

    // Storage
    DatabaseOpenFailed,
    DatabaseUnavailable,
    DatabaseQueryFailed,
    MigrationFailed,

    // Expressions
    ExpressionCompileFailed,
    ExpressionEvaluationFailed,

    StaticRulesParseFailed,
};

inline const char* error_code_name(ErrorCode code)
{
    switch (code) {
        case ErrorCode::Unknown:
            return "Unknown";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::ResourceNotFound:
            return "ResourceNotFound";
        case ErrorCode::EmptyRuleArray:
            return "EmptyRuleArray";
        case ErrorCode::RuleInvalid:
            return "RuleInvalid";
        case ErrorCode::RuleInvalidExpression:
            return "RuleInvalidExpression";
        case ErrorCode::RemoveRuleFailed:
            return "RemoveRuleFailed";
        case ErrorCode::InsertOrReplaceRuleFailed:
            return "InsertOrReplaceRuleFailed";
        case ErrorCode::DatabaseOpenFailed:
            return "DatabaseOpenFailed";
        case ErrorCode::DatabaseUnavailable:
            return "DatabaseUnavailable";
        case ErrorCode::DatabaseQueryFailed:
            return "DatabaseQueryFailed";
        case ErrorCode::MigrationFailed:
            return "MigrationFailed";
        case ErrorCode::ExpressionCompileFailed:
            return "ExpressionCompileFailed";
        case ErrorCode::ExpressionEvaluationFailed:
            return "ExpressionEvaluationFailed";
        case ErrorCode::StaticRulesParseFailed:
            return "StaticRulesParseFailed";
    }
    return "Unknown";
}

class Error {
  public:
    Error(ErrorCode code, std::string message, std::string detail = {})
        : code_(code), message_(std::move(message)), detail_(std::move(detail))
    {
    }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& detail() const { return detail_; }

    [[nodiscard]] std::string to_string() const
    {
        std::string out = std::string("[") + error_code_name(code_) + "] " + message_;
        if (!detail_.empty()) {
            out += ": " + detail_;
        }
        return out;
    }

  private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
class Result {
  public:
    Result(const T& value) : storage_(value) {}
    Result(T&& value) : storage_(std::move(value)) {}
    Result(const Error& error) : storage_(error) {}
    Result(Error&& error) : storage_(std::move(error)) {}

    template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                                      !std::is_same_v<std::decay_t<U>, Result> &&
                                                      !std::is_same_v<std::decay_t<U>, Error>>>
    Result(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    [[nodiscard]] bool ok() const { return storage_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<0>(storage_); }
    const T& value() const& { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    [[nodiscard]] const Error& error() const { return std::get<1>(storage_); }

  private:
    std::variant<T, Error> storage_;
};

template <>
class Result<void> {
  public:
    Result() = default;
    Result(const Error& error) : error_(error), ok_(false) {}
    Result(Error&& error) : error_(std::move(error)), ok_(false) {}

    [[nodiscard]] bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    [[nodiscard]] const Error& error() const { return error_; }

  private:
    Error error_{ErrorCode::Unknown, ""};
    bool ok_ = true;
};

} // namespace binauthz

// Propagate the error of a Result-returning expression to the caller.
#define TRY(expr)                                                                                                      \
    do {                                                                                                               \
        auto _try_result = (expr);                                                                                     \
        if (!_try_result) {                                                                                            \
            return _try_result.error();                                                                                \
        }                                                                                                              \
    } while (0)
