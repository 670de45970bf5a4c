// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <chrono>
#include <string>

namespace binauthz {

std::string make_span_id(const std::string& prefix);

// Thread-local context of the innermost live ScopedSpan; empty outside any span.
std::string current_trace_id();
std::string current_span_id();

/**
 * RAII span around one logical operation.
 *
 * When BINAUTHZ_OTEL_SPANS is "1" or "true" the span emits otel_span_start and
 * otel_span_end log entries carrying the trace id, span id, parent span id,
 * duration and status. Spans always maintain the thread-local context so nested
 * spans can pick up their parent.
 */
class ScopedSpan {
  public:
    ScopedSpan(std::string name, std::string trace_id, std::string parent_span_id = {});
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void fail(const std::string& error);

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    [[nodiscard]] const std::string& span_id() const { return span_id_; }

  private:
    std::string name_;
    std::string trace_id_;
    std::string span_id_;
    std::string parent_span_id_;
    std::string previous_trace_id_;
    std::string previous_span_id_;
    std::string error_;
    bool failed_ = false;
    bool emit_ = false;
    std::chrono::steady_clock::time_point start_;
};

} // namespace binauthz
