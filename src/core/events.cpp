#include "bdsm/core/events.hpp"
#include "bdsm/core/utils.hpp"

namespace bdsm::core {

json EventEmitter::make_event(const char* type, const std::string& run_id) {
    json event = json::object();
    event["type"] = type;
    event["run_id"] = run_id;
    event["ts"] = get_iso_timestamp();
    return event;
}

json EventEmitter::make_op_event(const char* type, const std::string& run_id, int op_index,
                                 const std::string& name) {
    json event = make_event(type, run_id);
    event["op"] = op_index;
    event["op_name"] = name;
    return event;
}

// Extra fields never replace the common ones.
void EventEmitter::write(json event, const json& extra, std::ostream& out) {
    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            if (!event.contains(it.key())) {
                event[it.key()] = it.value();
            }
        }
    }
    out << event.dump() << '\n';
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    write(make_event("run_start", run_id), extra, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const std::string& status,
                           std::ostream& out) {
    write(make_event("run_end", run_id), {{"success", success}, {"status", status}}, out);
}

void EventEmitter::op_start(const std::string& run_id, int op_index, const std::string& name,
                            std::ostream& out) {
    write(make_op_event("op_start", run_id, op_index, name), json::object(), out);
}

void EventEmitter::op_end(const std::string& run_id, int op_index, const std::string& name,
                          const std::string& status, const json& extra, std::ostream& out) {
    json event = make_op_event("op_end", run_id, op_index, name);
    event["status"] = status;
    write(std::move(event), extra, out);
}

void EventEmitter::op_skipped(const std::string& run_id, int op_index, const std::string& name,
                              std::ostream& out) {
    write(make_op_event("op_skipped", run_id, op_index, name), json::object(), out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message, std::ostream& out) {
    write(make_event("warning", run_id), {{"message", message}}, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message, std::ostream& out) {
    write(make_event("error", run_id), {{"message", message}}, out);
}

} // namespace bdsm::core
