#include "notifier.hpp"

#include <exception>
#include <spdlog/spdlog.h>

namespace intraday {

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::INFO: return "INFO";
        case Severity::WARNING: return "WARNING";
        case Severity::ERROR: return "ERROR";
        case Severity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

void LogNotifier::notify(Severity severity, const std::string& title, const std::string& body) {
    switch (severity) {
        case Severity::INFO:
            spdlog::info("[notify] {}: {}", title, body);
            break;
        case Severity::WARNING:
            spdlog::warn("[notify] {}: {}", title, body);
            break;
        case Severity::ERROR:
            spdlog::error("[notify] {}: {}", title, body);
            break;
        case Severity::CRITICAL:
            spdlog::critical("[notify] {}: {}", title, body);
            break;
    }
}

void FanoutNotifier::add(std::shared_ptr<Notifier> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void FanoutNotifier::notify(Severity severity, const std::string& title, const std::string& body) {
    std::vector<std::shared_ptr<Notifier>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        try {
            sink->notify(severity, title, body);
        } catch (const std::exception& e) {
            spdlog::error("Notification '{}' failed: {}", title, e.what());
        }
    }
}

} // namespace intraday
