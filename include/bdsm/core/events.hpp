#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace bdsm::core {

using json = nlohmann::json;

// JSON-lines event log of a processing run. Every event carries "type",
// "run_id" and "ts"; op events add "op" (chain index) and "op_name".
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void op_start(const std::string& run_id, int op_index, const std::string& name, std::ostream& out);
    void op_end(const std::string& run_id, int op_index, const std::string& name,
                const std::string& status, const json& extra, std::ostream& out);
    void op_skipped(const std::string& run_id, int op_index, const std::string& name, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    static json make_event(const char* type, const std::string& run_id);
    static json make_op_event(const char* type, const std::string& run_id, int op_index,
                              const std::string& name);
    void write(json event, const json& extra, std::ostream& out);
};

} // namespace bdsm::core
