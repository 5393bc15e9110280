#include "photo_triage/core/events.hpp"
#include "photo_triage/core/utils.hpp"

#include <iostream>

namespace photo_triage::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    std::lock_guard<std::mutex> lock(mutex_);
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
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase,
                               const std::string& name, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = name;
    emit(event, out);
}

void EventEmitter::phase_progress_counts(const std::string& run_id, Phase phase, int current,
                                         int total, const std::string& substep,
                                         const std::string& unit, std::ostream& out) {
    json event = base_event("phase_progress", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 1.0f;
    event["substep"] = substep;
    event["unit"] = unit;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[" << phase_to_string(phase) << "] " << status;
    if (!extra.empty()) {
        std::cout << " " << extra.dump();
    }
    std::cout << std::endl;
}

void EventEmitter::image_failed(const std::string& run_id, Phase phase,
                                const FailureRecord& failure, std::ostream& out) {
    json event = base_event("image_failed", run_id);
    event["phase"] = phase_to_int(phase);
    event["path"] = failure.path.string();
    event["fingerprint"] = failure.fingerprint;
    event["stage"] = failure_stage_to_string(failure.stage);
    event["kind"] = failure.kind;
    event["message"] = failure.message;
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

} // namespace photo_triage::core
