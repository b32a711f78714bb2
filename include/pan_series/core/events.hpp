#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace pan_series::core {

using json = nlohmann::json;

// JSON-lines event log. Safe to share between worker threads.
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out) : out_(out) {}

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status);

    void phase_start(const std::string& run_id, Phase phase, const std::string& region);
    void phase_end(const std::string& run_id, Phase phase, const std::string& region,
                   const std::string& status, const json& extra = json::object());

    void scene_failure(const std::string& run_id, const std::string& region,
                       const Timestamp& timestamp, const std::string& reason);

    void export_error(const std::string& run_id, const std::string& region,
                      const std::string& path, const std::string& reason);

    void error(const std::string& run_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& run_id);

    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace pan_series::core
