#include <atomic>
#include "common/log.hpp"

namespace mbframer {

namespace {

std::atomic<LogSink> g_log_sink{nullptr};

}  // namespace

void SetLogSink(LogSink sink) noexcept {
  g_log_sink.store(sink, std::memory_order_release);
}

LogSink GetLogSink() noexcept {
  return g_log_sink.load(std::memory_order_acquire);
}

}  // namespace mbframer
