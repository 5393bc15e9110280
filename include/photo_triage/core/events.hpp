#pragma once

#include "types.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace photo_triage::core {

using json = nlohmann::json;

// JSON-lines event stream. Safe to call from worker threads.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, const std::string& name, std::ostream& out);
    void phase_progress_counts(const std::string& run_id, Phase phase, int current, int total,
                               const std::string& substep, const std::string& unit,
                               std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void image_failed(const std::string& run_id, Phase phase, const FailureRecord& failure,
                      std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    std::mutex mutex_;
};

} // namespace photo_triage::core
