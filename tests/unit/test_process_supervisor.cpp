#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "runtime/process_supervisor.hpp"
#include "runtime/protocol_client.hpp"

namespace {

using nlohmann::json;
using toolmux::core::config::ServerConfig;
using toolmux::core::errors::ErrorCategory;
using toolmux::core::errors::get_error;
using toolmux::core::errors::get_value;
using toolmux::core::errors::is_error;
using toolmux::runtime::ProcessSupervisor;
using toolmux::runtime::ProcessTransport;
using toolmux::runtime::ProtocolClient;
using toolmux::runtime::ServerState;

ServerConfig mock_server(const std::string& name, std::vector<std::string> args = {}) {
    ServerConfig config;
    config.name = name;
    config.command = TOOLMUX_MOCK_SERVER_PATH;
    config.args = std::move(args);
    return config;
}

std::string request_line(int id, const std::string& method, const json& params) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}}.dump() +
           "\n";
}

std::chrono::steady_clock::time_point soon() {
    return std::chrono::steady_clock::now() + std::chrono::seconds(5);
}

struct ExitRecorder {
    std::mutex mutex;
    std::string server_name;
    int exit_code = 0;
    std::atomic_int calls{0};

    ProcessSupervisor::ExitHandler handler() {
        return [this](const std::string& name, int code) {
            std::lock_guard<std::mutex> lock(mutex);
            server_name = name;
            exit_code = code;
            ++calls;
        };
    }
};

TEST(ProcessSupervisorTest, MissingExecutableIsSpawnError) {
    ProcessSupervisor supervisor;
    ServerConfig config;
    config.name = "ghost";
    config.command = "/nonexistent/toolmux-definitely-missing";

    auto started = supervisor.start(config);
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).category, ErrorCategory::ProcessSpawn);
    EXPECT_EQ(get_error(started).code, "exec_failed");
    EXPECT_FALSE(get_error(started).hint.empty());
    EXPECT_EQ(supervisor.process_count(), 0u);
}

TEST(ProcessSupervisorTest, EmptyCommandIsRejected) {
    ProcessSupervisor supervisor;
    ServerConfig config;
    config.name = "blank";

    auto started = supervisor.start(config);
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).code, "empty_command");
}

TEST(ProcessSupervisorTest, StartsExchangesLinesAndTerminates) {
    ExitRecorder recorder;
    ProcessSupervisor supervisor(recorder.handler());

    auto started = supervisor.start(mock_server("mock"));
    ASSERT_FALSE(is_error(started));
    auto process = get_value(started);
    EXPECT_GT(process->pid(), 0);
    EXPECT_EQ(process->state(), ServerState::Starting);
    EXPECT_EQ(supervisor.find("mock"), process);

    auto duplicate = supervisor.start(mock_server("mock"));
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_server");

    ASSERT_FALSE(is_error(
        process->write_stdin(request_line(1, "tools/list", json::object()), soon())));
    const auto line = process->read_stdout_line();
    ASSERT_TRUE(line.has_value());
    const auto response = json::parse(*line);
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["result"]["tools"][0]["name"], "search");

    supervisor.terminate(*process, std::chrono::milliseconds(2000));
    EXPECT_TRUE(process->has_exited());
    EXPECT_EQ(process->state(), ServerState::Terminated);
    EXPECT_EQ(supervisor.process_count(), 0u);
    EXPECT_EQ(recorder.calls.load(), 0);

    auto after = process->write_stdin(request_line(2, "tools/list", json::object()), soon());
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).category, ErrorCategory::ServerUnavailable);
}

TEST(ProcessSupervisorTest, UnexpectedExitIsReportedAndMarksFailed) {
    ExitRecorder recorder;
    ProcessSupervisor supervisor(recorder.handler());

    auto started = supervisor.start(mock_server("crashy", {"--exit-on-initialize"}));
    ASSERT_FALSE(is_error(started));
    auto process = get_value(started);
    ASSERT_FALSE(is_error(
        process->write_stdin(request_line(1, "initialize", json::object()), soon())));

    ASSERT_TRUE(process->wait_for_exit(std::chrono::milliseconds(5000)));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (recorder.calls.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(recorder.calls.load(), 1);
    {
        std::lock_guard<std::mutex> lock(recorder.mutex);
        EXPECT_EQ(recorder.server_name, "crashy");
        EXPECT_EQ(recorder.exit_code, 3);
    }
    EXPECT_EQ(process->exit_code().value_or(-1), 3);
    EXPECT_EQ(process->state(), ServerState::Failed);
    EXPECT_FALSE(process->read_stdout_line().has_value());

    supervisor.terminate(*process, std::chrono::milliseconds(100));
    EXPECT_EQ(process->state(), ServerState::Terminated);
}

TEST(ProcessSupervisorTest, IgnoredSigtermEscalatesToKill) {
    ProcessSupervisor supervisor;
    auto started = supervisor.start(mock_server("stubborn", {"--ignore-sigterm", "--linger"}));
    ASSERT_FALSE(is_error(started));
    auto process = get_value(started);

    // Make sure the handler is installed before signalling.
    ASSERT_FALSE(is_error(
        process->write_stdin(request_line(1, "tools/list", json::object()), soon())));
    ASSERT_TRUE(process->read_stdout_line().has_value());

    supervisor.terminate(*process, std::chrono::milliseconds(100));
    EXPECT_TRUE(process->has_exited());
    EXPECT_EQ(process->exit_code().value_or(-1), 128 + 9);
}

TEST(ProcessSupervisorTest, StderrIsDrainedSoStdoutKeepsFlowing) {
    ProcessSupervisor supervisor;
    auto started = supervisor.start(mock_server("chatty", {"--noisy-stderr", "20000"}));
    ASSERT_FALSE(is_error(started));
    auto process = get_value(started);

    ASSERT_FALSE(is_error(
        process->write_stdin(request_line(1, "tools/list", json::object()), soon())));
    const auto line = process->read_stdout_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(json::parse(*line)["id"], 1);

    const auto tail = process->stderr_tail();
    EXPECT_FALSE(tail.empty());
    EXPECT_LE(tail.size(), 50u);
}

TEST(ProcessSupervisorTest, EnvironmentOverridesReachTheChild) {
    ProcessSupervisor supervisor;
    auto config = mock_server("env");
    config.env["TOOLMUX_TEST_VALUE"] = "from-config";
    auto started = supervisor.start(config);
    ASSERT_FALSE(is_error(started));
    auto process = get_value(started);

    const json params{{"name", "search"}, {"arguments", {{"env", "TOOLMUX_TEST_VALUE"}}}};
    ASSERT_FALSE(is_error(process->write_stdin(request_line(7, "tools/call", params), soon())));
    const auto line = process->read_stdout_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(json::parse(*line)["result"]["env_value"], "from-config");
}

TEST(ProcessSupervisorTest, ShutdownAllStopsEveryServer) {
    ProcessSupervisor supervisor;
    auto a = supervisor.start(mock_server("a"));
    auto b = supervisor.start(mock_server("b"));
    ASSERT_FALSE(is_error(a));
    ASSERT_FALSE(is_error(b));
    EXPECT_EQ(supervisor.process_count(), 2u);

    supervisor.shutdown_all(std::chrono::milliseconds(2000));
    EXPECT_EQ(supervisor.process_count(), 0u);
    EXPECT_TRUE(get_value(a)->has_exited());
    EXPECT_TRUE(get_value(b)->has_exited());
    supervisor.shutdown_all(std::chrono::milliseconds(2000));
}

TEST(ProcessSupervisorTest, RequestedShutdownIsNotReportedAsExit) {
    ExitRecorder recorder;
    ProcessSupervisor supervisor(recorder.handler());
    auto started = supervisor.start(mock_server("quiet"));
    ASSERT_FALSE(is_error(started));
    auto process = get_value(started);

    // The mock exits as soon as its stdin closes, before any signal is sent.
    supervisor.begin_shutdown();
    process->close_pipes();
    ASSERT_TRUE(process->wait_for_exit(std::chrono::milliseconds(5000)));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(recorder.calls.load(), 0);
    EXPECT_NE(process->state(), ServerState::Failed);

    supervisor.shutdown_all(std::chrono::milliseconds(1000));
    EXPECT_EQ(recorder.calls.load(), 0);
    EXPECT_EQ(process->state(), ServerState::Terminated);
}

TEST(ProcessSupervisorTest, StalledStdinDoesNotBlockCallOrClose) {
    ProcessSupervisor supervisor;
    auto started = supervisor.start(mock_server("deaf", {"--ignore-stdin"}));
    ASSERT_FALSE(is_error(started));
    auto process = get_value(started);

    ProtocolClient client("deaf", std::make_unique<ProcessTransport>(process));
    client.start();

    // Far larger than a pipe buffer, so the write cannot complete.
    const std::string blob(1024 * 1024, 'x');
    const auto call_started = std::chrono::steady_clock::now();
    auto called = client.call("tools/call", {{"name", "search"}, {"arguments", {{"q", blob}}}},
                              std::chrono::milliseconds(200));
    const auto call_elapsed = std::chrono::steady_clock::now() - call_started;
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).category, ErrorCategory::Timeout);
    EXPECT_LT(call_elapsed, std::chrono::seconds(3));

    // A second writer queues behind the broken stream and must not hang either.
    auto followup = client.call("tools/list", json::object(), std::chrono::milliseconds(200));
    ASSERT_TRUE(is_error(followup));

    const auto close_started = std::chrono::steady_clock::now();
    client.close();
    EXPECT_LT(std::chrono::steady_clock::now() - close_started, std::chrono::seconds(3));

    supervisor.terminate(*process, std::chrono::milliseconds(200));
    EXPECT_TRUE(process->has_exited());
}

}  // namespace
