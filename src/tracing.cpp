// cppcheck-suppress-file missingIncludeSystem
#include "tracing.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>

#include "logging.hpp"
#include "utils.hpp"

namespace binauthz {

namespace {

thread_local std::string g_trace_id;
thread_local std::string g_span_id;

bool spans_enabled()
{
    const std::string v = to_lower(env_or_default("BINAUTHZ_OTEL_SPANS", ""));
    return v == "1" || v == "true";
}

} // namespace

std::string make_span_id(const std::string& prefix)
{
    static std::atomic<uint64_t> counter{0};
    const uint64_t seq = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%llx-%llx", static_cast<unsigned long long>(now),
                  static_cast<unsigned long long>(seq));
    return prefix + "-" + buf;
}

std::string current_trace_id()
{
    return g_trace_id;
}

std::string current_span_id()
{
    return g_span_id;
}

ScopedSpan::ScopedSpan(std::string name, std::string trace_id, std::string parent_span_id)
    : name_(std::move(name)), trace_id_(std::move(trace_id)), span_id_(make_span_id("span")),
      parent_span_id_(std::move(parent_span_id)), previous_trace_id_(g_trace_id), previous_span_id_(g_span_id),
      emit_(spans_enabled()), start_(std::chrono::steady_clock::now())
{
    g_trace_id = trace_id_;
    g_span_id = span_id_;

    if (emit_) {
        logger().log(SLOG_INFO("otel_span_start")
                         .field("span_name", name_)
                         .field("trace_id", trace_id_)
                         .field("span_id", span_id_)
                         .field("parent_span_id", parent_span_id_));
    }
}

ScopedSpan::~ScopedSpan()
{
    if (emit_) {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_).count();
        auto entry = SLOG_INFO("otel_span_end");
        entry.field("span_name", name_)
            .field("trace_id", trace_id_)
            .field("span_id", span_id_)
            .field("parent_span_id", parent_span_id_)
            .field("duration_us", static_cast<int64_t>(elapsed))
            .field("status", failed_ ? "error" : "ok");
        if (failed_) {
            entry.field("error", error_);
        }
        logger().log(entry);
    }

    g_trace_id = previous_trace_id_;
    g_span_id = previous_span_id_;
}

void ScopedSpan::fail(const std::string& error)
{
    failed_ = true;
    error_ = error;
}

} // namespace binauthz
