#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <ostream>
#include <string>

namespace annual_mosaic::core {

using json = nlohmann::json;

/**
 * JSON-lines run events. Every event carries "type", "run_id" and "ts" and is
 * written to `out` and, when open, to the log file.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ofstream* log_file = nullptr);

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const json& extra = json::object());

    void year_start(const std::string& run_id, const YearWindow& window, int scenes_selected);
    void year_end(const std::string& run_id, int year, const std::string& status, const json& extra);
    void year_failed(const std::string& run_id, int year, const std::string& message);

    void scene_rejected(const std::string& run_id, int year, const SceneRejection& rejection);

    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream& out_;
    std::ofstream* log_file_;
};

} // namespace annual_mosaic::core
