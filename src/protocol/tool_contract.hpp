#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace toolmux::protocol {

    // A tool discovered from a server's tools/list response
    struct ToolDescriptor {
        std::string name;          // unique across the registry
        std::string server_name;   // owning server
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    // Which server/tool produced a result
    struct Provenance {
        std::string trace_id;
        std::string server_name;
        std::string tool_name;
        double elapsed_ms = 0.0;
    };

    // Successful tools/call outcome; failures travel as OrchestratorError
    struct ToolResult {
        nlohmann::json payload;
        Provenance provenance;
    };

    inline nlohmann::json provenance_to_json(const Provenance& provenance) {
        return nlohmann::json{{"trace_id", provenance.trace_id},
                              {"server", provenance.server_name},
                              {"tool", provenance.tool_name},
                              {"elapsed_ms", provenance.elapsed_ms}};
    }

    // Payload with an embedded "_provenance" member. Non-object payloads are
    // wrapped under "result".
    inline nlohmann::json to_json(const ToolResult& result) {
        nlohmann::json out = result.payload.is_object()
                                 ? result.payload
                                 : nlohmann::json{{"result", result.payload}};
        out["_provenance"] = provenance_to_json(result.provenance);
        return out;
    }

    // Shape expected by function-calling models
    inline nlohmann::json to_function_schema(const ToolDescriptor& tool) {
        return nlohmann::json{{"type", "function"},
                              {"name", tool.name},
                              {"description", tool.description},
                              {"parameters", tool.input_schema}};
    }

} // namespace toolmux::protocol
