// Scriptable stdio tool server used by the supervisor and end-to-end tests.
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

struct Options {
    std::vector<std::string> tools;
    std::set<std::string> silent_tools;
    std::set<std::string> rpc_error_tools;
    std::set<std::string> crash_tools;
    bool fail_initialize = false;
    bool exit_on_initialize = false;
    bool never_answer_list = false;
    bool garbage_before_response = false;
    bool paged = false;
    bool ping_client = false;
    bool ignore_sigterm = false;
    bool linger = false;
    bool ignore_stdin = false;
    int noisy_stderr_lines = 0;
};

std::mutex out_mutex;
std::atomic_bool client_ponged{false};

void emit(const json& message) {
    std::lock_guard<std::mutex> lock(out_mutex);
    std::cout << message.dump() << "\n" << std::flush;
}

void emit_raw(const std::string& line) {
    std::lock_guard<std::mutex> lock(out_mutex);
    std::cout << line << "\n" << std::flush;
}

json result_response(const json& id, const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json tool_entry(const std::string& name) {
    return json{{"name", name},
                {"description", "Mock tool " + name},
                {"inputSchema",
                 {{"type", "object"},
                  {"properties", {{"q", {{"type", "string"}}}}},
                  {"required", json::array({"q"})}}}};
}

Options parse_options(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        const bool has_value = i + 1 < argc;
        if (flag == "--tool" && has_value) {
            options.tools.push_back(argv[++i]);
        } else if (flag == "--silent-tool" && has_value) {
            options.silent_tools.insert(argv[++i]);
        } else if (flag == "--rpc-error-tool" && has_value) {
            options.rpc_error_tools.insert(argv[++i]);
        } else if (flag == "--crash-tool" && has_value) {
            options.crash_tools.insert(argv[++i]);
        } else if (flag == "--noisy-stderr" && has_value) {
            options.noisy_stderr_lines = std::atoi(argv[++i]);
        } else if (flag == "--fail-initialize") {
            options.fail_initialize = true;
        } else if (flag == "--exit-on-initialize") {
            options.exit_on_initialize = true;
        } else if (flag == "--never-answer-list") {
            options.never_answer_list = true;
        } else if (flag == "--garbage-before-response") {
            options.garbage_before_response = true;
        } else if (flag == "--paged") {
            options.paged = true;
        } else if (flag == "--ping-client") {
            options.ping_client = true;
        } else if (flag == "--ignore-sigterm") {
            options.ignore_sigterm = true;
        } else if (flag == "--linger") {
            options.linger = true;
        } else if (flag == "--ignore-stdin") {
            options.ignore_stdin = true;
        }
    }
    if (options.tools.empty()) {
        options.tools.push_back("search");
    }
    return options;
}

void answer_tools_list(const Options& options, const json& id, const json& params) {
    json tools = json::array();
    json result = json::object();
    if (!options.paged) {
        for (const auto& name : options.tools) {
            tools.push_back(tool_entry(name));
        }
    } else {
        // One tool per page; the cursor is the index of the next tool.
        std::size_t index = 0;
        if (params.is_object() && params.contains("cursor")) {
            index = static_cast<std::size_t>(std::stoul(params["cursor"].get<std::string>()));
        }
        if (index < options.tools.size()) {
            tools.push_back(tool_entry(options.tools[index]));
        }
        if (index + 1 < options.tools.size()) {
            result["nextCursor"] = std::to_string(index + 1);
        }
    }
    result["tools"] = tools;
    emit(result_response(id, result));
}

void answer_tools_call(const Options& options, const json& id, const json& params) {
    const std::string name = params.value("name", "");
    const json arguments = params.value("arguments", json::object());

    if (options.crash_tools.count(name) != 0) {
        std::exit(7);
    }
    if (options.silent_tools.count(name) != 0) {
        return;
    }
    if (options.rpc_error_tools.count(name) != 0) {
        emit(json{{"jsonrpc", "2.0"},
                  {"id", id},
                  {"error", {{"code", -32000}, {"message", "boom"}, {"data", {{"tool", name}}}}}});
        return;
    }

    json result{{"content", json::array({{{"type", "text"}, {"text", "ok:" + name}}})},
                {"tool", name},
                {"echo", arguments},
                {"client_ponged", client_ponged.load()}};
    if (arguments.contains("env") && arguments["env"].is_string()) {
        const char* value = std::getenv(arguments["env"].get<std::string>().c_str());
        result["env_value"] = value == nullptr ? json() : json(value);
    }

    const int delay_ms = arguments.value("delay_ms", 0);
    if (delay_ms > 0) {
        std::thread([id, result, delay_ms] {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            emit(result_response(id, result));
        }).detach();
        return;
    }
    if (options.garbage_before_response) {
        emit_raw("this is {not json");
    }
    emit(result_response(id, result));
}

}  // namespace

int main(int argc, char* argv[]) {
    const Options options = parse_options(argc, argv);
    if (options.ignore_sigterm) {
        std::signal(SIGTERM, SIG_IGN);
    }
    for (int i = 0; i < options.noisy_stderr_lines; ++i) {
        std::cerr << "mock stderr line " << i
                  << " ........................................................................\n";
    }
    std::cerr << std::flush;

    // Never read stdin, so the client's writes back up once the pipe fills.
    while (options.ignore_stdin) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        const json message = json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            continue;
        }

        if (!message.contains("method")) {
            if (message.value("id", json()) == json("srv-ping-1")) {
                client_ponged.store(true);
            }
            continue;
        }

        const std::string method = message["method"].get<std::string>();
        const json id = message.value("id", json());
        const json params = message.value("params", json::object());

        if (method == "initialize") {
            if (options.exit_on_initialize) {
                return 3;
            }
            if (options.fail_initialize) {
                emit(json{{"jsonrpc", "2.0"},
                          {"id", id},
                          {"error", {{"code", -32603}, {"message", "initialization refused"}}}});
                continue;
            }
            emit(result_response(id, {{"protocolVersion", "2024-11-05"},
                                      {"capabilities", {{"tools", json::object()}}},
                                      {"serverInfo", {{"name", "mock"}, {"version", "0.1.0"}}}}));
        } else if (method == "notifications/initialized") {
            emit(json{{"jsonrpc", "2.0"},
                      {"method", "notifications/message"},
                      {"params", {{"level", "info"}, {"data", "mock ready"}}}});
            if (options.ping_client) {
                emit(json{{"jsonrpc", "2.0"}, {"id", "srv-ping-1"}, {"method", "ping"}});
            }
        } else if (method == "tools/list") {
            if (!options.never_answer_list) {
                answer_tools_list(options, id, params);
            }
        } else if (method == "tools/call") {
            answer_tools_call(options, id, params);
        } else if (!id.is_null()) {
            emit(json{{"jsonrpc", "2.0"},
                      {"id", id},
                      {"error", {{"code", -32601}, {"message", "Method not found"}}}});
        }
    }
    // Stay alive after stdin closes so only a signal can stop us.
    while (options.linger) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    return 0;
}
