#include "ast_placer/core/events.hpp"
#include "ast_placer/core/utils.hpp"

namespace ast_placer::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    const std::string line = event.dump();
    out << line << "\n";
    out.flush();

    if (mirror_) {
        (*mirror_) << line << "\n";
        mirror_->flush();
    }
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

void EventEmitter::stage_start(const std::string& run_id, Stage stage, std::ostream& out) {
    json event = base_event("stage_start", run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    emit(event, out);
}

void EventEmitter::stage_end(const std::string& run_id, Stage stage,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("stage_end", run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
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

} // namespace ast_placer::core
