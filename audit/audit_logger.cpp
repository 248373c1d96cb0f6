#include "audit_logger.hpp"

#include "../common/clock.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace pqgate {

AuditLogger::AuditLogger(const std::string &log_path) : log_path_(log_path) {}

void AuditLogger::log_event(const std::string &event_type, const nlohmann::json &payload) const {
    namespace fs = std::filesystem;

    if (log_path_.empty()) {
        return;
    }

    nlohmann::json line{{"ts", now_unix()}, {"event", event_type}, {"payload", payload}};
    // Replace invalid UTF-8 instead of throwing from dump().
    const std::string text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);

    fs::path p(log_path_);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "pq-gate: audit: cannot create " << p.parent_path() << ": "
                      << ec.message() << std::endl;
            return;
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        std::cerr << "pq-gate: audit: cannot open " << log_path_ << std::endl;
        return;
    }
    out << text << '\n';
}

} // namespace pqgate
