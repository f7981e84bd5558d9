#include "cell_lineage/core/events.hpp"
#include "cell_lineage/core/utils.hpp"

namespace cell_lineage::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::location_start(const std::string& run_id, const std::string& location,
                                  const std::string& folder, std::ostream& out) {
    json event = base_event("location_start", run_id);
    event["location"] = location;
    event["folder"] = folder;
    emit(event, out);
}

void EventEmitter::location_end(const std::string& run_id, const std::string& location,
                                const std::string& status, const json& extra,
                                std::ostream& out) {
    json event = base_event("location_end", run_id);
    event["location"] = location;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase,
                               const std::string& location, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["location"] = location;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& location, const std::string& status,
                             const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["location"] = location;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::track_rejected(const std::string& run_id, const std::string& location,
                                  TrackId track_id, const std::string& reason,
                                  std::ostream& out) {
    json event = base_event("track_rejected", run_id);
    event["location"] = location;
    event["track_id"] = track_id;
    event["reason"] = reason;
    emit(event, out);
}

void EventEmitter::track_failed(const std::string& run_id, const std::string& location,
                                TrackId track_id, const std::string& error_kind,
                                const std::string& cause, std::ostream& out) {
    json event = base_event("track_failed", run_id);
    event["location"] = location;
    event["track_id"] = track_id;
    event["error"] = error_kind;
    event["message"] = cause;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace cell_lineage::core
