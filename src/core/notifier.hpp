#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace intraday {

enum class Severity { INFO, WARNING, ERROR, CRITICAL };

const char* to_string(Severity severity);

/**
 * Alert collaborator. Delivery is fire-and-forget; callers never depend on
 * a notification having been delivered.
 */
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(Severity severity, const std::string& title, const std::string& body) = 0;
};

/**
 * Writes notifications to the process log.
 */
class LogNotifier : public Notifier {
public:
    void notify(Severity severity, const std::string& title, const std::string& body) override;
};

/**
 * Forwards to every registered sink. A sink that throws is logged and
 * skipped; the failure never reaches the caller.
 */
class FanoutNotifier : public Notifier {
public:
    void add(std::shared_ptr<Notifier> sink);
    void notify(Severity severity, const std::string& title, const std::string& body) override;

private:
    std::mutex mutex_;
    std::vector<std::shared_ptr<Notifier>> sinks_;
};

} // namespace intraday
