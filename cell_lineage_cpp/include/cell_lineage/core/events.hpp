#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace cell_lineage::core {

using json = nlohmann::json;

// JSON-lines event log. One object per line, each with type, run_id and ts.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra, std::ostream& out);

    void location_start(const std::string& run_id, const std::string& location,
                        const std::string& folder, std::ostream& out);
    void location_end(const std::string& run_id, const std::string& location,
                      const std::string& status, const json& extra, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, const std::string& location,
                     std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& location,
                   const std::string& status, const json& extra, std::ostream& out);

    void track_rejected(const std::string& run_id, const std::string& location,
                        TrackId track_id, const std::string& reason, std::ostream& out);
    void track_failed(const std::string& run_id, const std::string& location,
                      TrackId track_id, const std::string& error_kind,
                      const std::string& cause, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace cell_lineage::core
