#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace ast_placer::core {

using json = nlohmann::json;

// JSON-lines run events, one object per line
class EventEmitter {
public:
    EventEmitter() = default;
    explicit EventEmitter(std::ostream* mirror) : mirror_(mirror) {}

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void stage_start(const std::string& run_id, Stage stage, std::ostream& out);
    void stage_end(const std::string& run_id, Stage stage, const std::string& status,
                   const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    std::ostream* mirror_ = nullptr;
};

} // namespace ast_placer::core
