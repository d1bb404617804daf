#include "annual_mosaic/core/events.hpp"
#include "annual_mosaic/core/dates.hpp"
#include "annual_mosaic/core/utils.hpp"

namespace annual_mosaic::core {

namespace {

void merge(json& event, const json& extra) {
    if (!extra.is_object()) return;
    for (const auto& [key, value] : extra.items()) {
        event[key] = value;
    }
}

} // namespace

EventEmitter::EventEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();
    out_ << line << std::endl;
    if (log_file_ && log_file_->is_open()) {
        *log_file_ << line << std::endl;
    }
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    merge(event, extra);
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const json& extra) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = success ? "ok" : "error";
    merge(event, extra);
    emit(event);
}

void EventEmitter::year_start(const std::string& run_id, const YearWindow& window,
                              int scenes_selected) {
    json event = base_event("year_start", run_id);
    event["year"] = window.year;
    event["start"] = format_date(window.window.start);
    event["end"] = format_date(window.window.end);
    event["scenes_selected"] = scenes_selected;
    emit(event);
}

void EventEmitter::year_end(const std::string& run_id, int year, const std::string& status,
                            const json& extra) {
    json event = base_event("year_end", run_id);
    event["year"] = year;
    event["status"] = status;
    merge(event, extra);
    emit(event);
}

void EventEmitter::year_failed(const std::string& run_id, int year, const std::string& message) {
    json event = base_event("year_failed", run_id);
    event["year"] = year;
    event["message"] = message;
    emit(event);
}

void EventEmitter::scene_rejected(const std::string& run_id, int year,
                                  const SceneRejection& rejection) {
    json event = base_event("scene_rejected", run_id);
    event["year"] = year;
    event["scene_id"] = rejection.scene_id;
    event["reason"] = rejection_kind_to_string(rejection.kind);
    event["message"] = rejection.message;
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace annual_mosaic::core
