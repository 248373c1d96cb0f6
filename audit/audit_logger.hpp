#pragma once

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>

namespace pqgate {

class AuditLogger {
public:
    // An empty path disables file output; events then go nowhere.
    explicit AuditLogger(const std::string &log_path);

    // Appends one JSON line {"ts","event","payload"}. Safe to call from any
    // thread. Failures are reported on stderr and never thrown.
    void log_event(const std::string &event_type, const nlohmann::json &payload) const;

    const std::string &path() const { return log_path_; }

private:
    std::string log_path_;
    mutable std::mutex mutex_;
};

} // namespace pqgate
