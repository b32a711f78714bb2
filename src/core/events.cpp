#include "pan_series/core/events.hpp"
#include "pan_series/core/utils.hpp"

namespace pan_series::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const std::string& status) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, const std::string& region) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["region"] = region;
    emit(event);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase, const std::string& region,
                             const std::string& status, const json& extra) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["region"] = region;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::scene_failure(const std::string& run_id, const std::string& region,
                                 const Timestamp& timestamp, const std::string& reason) {
    json event = base_event("scene_failure", run_id);
    event["region"] = region;
    event["timestamp"] = format_iso8601(timestamp);
    event["reason"] = reason;
    emit(event);
}

void EventEmitter::export_error(const std::string& run_id, const std::string& region,
                                const std::string& path, const std::string& reason) {
    json event = base_event("export_error", run_id);
    event["region"] = region;
    event["path"] = path;
    event["reason"] = reason;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace pan_series::core
