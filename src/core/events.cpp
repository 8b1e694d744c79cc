#include "gas_deblend/core/events.hpp"
#include "gas_deblend/core/utils.hpp"

namespace gas_deblend::core {

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const json& extra, std::ostream& out) {
    json event = base_event("run_start");
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    emit(event, out);
}

void EventEmitter::run_end(bool success, const std::string& status, std::ostream& out) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::stage_start(Stage stage, std::ostream& out) {
    json event = base_event("stage_start");
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    emit(event, out);
}

void EventEmitter::stage_progress(Stage stage, int current, int total,
                                  const std::string& message, std::ostream& out) {
    json event = base_event("stage_progress");
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 1.0f;
    event["substep"] = message;
    emit(event, out);
}

void EventEmitter::stage_end(Stage stage, const std::string& status,
                             const json& extra, std::ostream& out) {
    json event = base_event("stage_end");
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["status"] = status;
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    emit(event, out);
}

void EventEmitter::warning(const std::string& message, std::ostream& out) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& message, std::ostream& out) {
    json event = base_event("error");
    event["message"] = message;
    emit(event, out);
}

} // namespace gas_deblend::core
