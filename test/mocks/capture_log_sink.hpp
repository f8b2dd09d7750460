#pragma once

#include <fairway_graph/core/log.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fairway_graph::testing {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

// ---------------------------------------------------------------------------
// CaptureSink — records every message for later inspection.
// ---------------------------------------------------------------------------
class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back({level, std::string(component), std::string(message)});
    }

    [[nodiscard]] bool Contains(LogLevel level, std::string_view fragment) const {
        return std::any_of(messages.begin(), messages.end(), [&](const auto& m) {
            return m.level == level && m.message.find(fragment) != std::string::npos;
        });
    }

    [[nodiscard]] std::size_t Count(LogLevel level) const {
        return static_cast<std::size_t>(std::count_if(
            messages.begin(), messages.end(),
            [&](const auto& m) { return m.level == level; }));
    }

    std::vector<CapturedMessage> messages;
};

// Installs a CaptureSink as the global logger for the lifetime of the guard,
// then puts back a silent logger.
class ScopedCaptureLogger {
public:
    ScopedCaptureLogger() {
        auto sink = std::make_unique<CaptureSink>();
        sink_ = sink.get();
        InitGlobalLogger(std::move(sink), LogLevel::Debug);
    }

    ~ScopedCaptureLogger() {
        InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
    }

    ScopedCaptureLogger(const ScopedCaptureLogger&) = delete;
    ScopedCaptureLogger& operator=(const ScopedCaptureLogger&) = delete;

    [[nodiscard]] const CaptureSink& Sink() const { return *sink_; }

private:
    CaptureSink* sink_ = nullptr;
};

} // namespace fairway_graph::testing
