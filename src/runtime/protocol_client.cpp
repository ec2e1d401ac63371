#include "runtime/protocol_client.hpp"

#include <cctype>
#include <future>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolmux::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestratorError;
using nlohmann::json;
using protocol::JsonRpcMessage;

namespace {

constexpr std::size_t kMaxLoggedLine = 300;

std::string clip(const std::string& text) {
    if (text.size() <= kMaxLoggedLine) {
        return text;
    }
    return text.substr(0, kMaxLoggedLine) + "...";
}

bool is_blank(const std::string& line) {
    for (const char c : line) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

OrchestratorError unavailable(const std::string& server_name, const std::string& why) {
    return OrchestratorError{ErrorCategory::ServerUnavailable,
                             "Server " + server_name + " is unavailable: " + why,
                             "server_unavailable"};
}

}  // namespace

ProtocolClient::ProtocolClient(std::string server_name, std::unique_ptr<Transport> transport,
                               ClosedHandler on_closed)
    : server_name_(std::move(server_name)),
      transport_(std::move(transport)),
      on_closed_(std::move(on_closed)),
      pending_(server_name_) {}

ProtocolClient::~ProtocolClient() {
    close();
}

void ProtocolClient::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (reader_.joinable() || closing_.load()) {
        return;
    }
    reader_ = std::thread([this] { read_loop(); });
}

bool ProtocolClient::is_open() const {
    return !closing_.load() && !stream_ended_.load();
}

std::size_t ProtocolClient::outstanding_calls() const {
    return pending_.outstanding();
}

core::errors::Result<std::size_t> ProtocolClient::send(
    const json& message, const std::chrono::steady_clock::time_point deadline) {
    const std::string line = protocol::serialize_line(message);
    std::unique_lock<std::timed_mutex> lock(write_mutex_, deadline);
    if (!lock.owns_lock()) {
        return OrchestratorError{ErrorCategory::Timeout,
                                 "Timed out waiting to write to " + server_name_,
                                 "write_timeout"};
    }
    return transport_->write_line(line, deadline);
}

core::errors::Result<std::size_t> ProtocolClient::notify(const std::string& method,
                                                         const json& params,
                                                         const std::chrono::milliseconds timeout) {
    if (!is_open()) {
        return unavailable(server_name_, "connection closed");
    }
    return send(protocol::make_notification(method, params),
                std::chrono::steady_clock::now() + timeout);
}

core::errors::Result<JsonRpcMessage> ProtocolClient::call(
    const std::string& method, const json& params, const std::chrono::milliseconds timeout) {
    if (!is_open()) {
        return unavailable(server_name_, "connection closed");
    }

    // One deadline covers the write and the wait for the response.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::int64_t id = next_id_.fetch_add(1);
    auto opened = pending_.open(id, method);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    std::future<CallOutcome> future = std::move(core::errors::get_value(opened));

    auto sent = send(protocol::make_request(id, method, params), deadline);
    if (core::errors::is_error(sent)) {
        static_cast<void>(pending_.abandon(id));
        const auto& error = core::errors::get_error(sent);
        if (error.category == ErrorCategory::Timeout) {
            LOG_WARN("[" + server_name_ + "] " + method + " (id " + std::to_string(id) +
                     ") could not be written within " + std::to_string(timeout.count()) + "ms");
            return OrchestratorError{ErrorCategory::Timeout,
                                     "Server " + server_name_ + " did not accept " + method +
                                         " within " + std::to_string(timeout.count()) + "ms",
                                     "call_timeout"};
        }
        return error;
    }

    if (future.wait_until(deadline) == std::future_status::timeout) {
        // Losing the race to complete() means the response arrived just now.
        if (pending_.abandon(id)) {
            LOG_WARN("[" + server_name_ + "] " + method + " (id " + std::to_string(id) +
                     ") timed out after " + std::to_string(timeout.count()) + "ms");
            return OrchestratorError{ErrorCategory::Timeout,
                                     "No response from " + server_name_ + " to " + method +
                                         " within " + std::to_string(timeout.count()) + "ms",
                                     "call_timeout"};
        }
    }
    return future.get();
}

void ProtocolClient::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    closing_.store(true);
    transport_->close();
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
    const std::size_t failed = pending_.close(unavailable(server_name_, "connection closed"));
    if (failed > 0) {
        LOG_DEBUG("[" + server_name_ + "] failed " + std::to_string(failed) +
                  " pending call(s) on close");
    }
}

void ProtocolClient::read_loop() {
    while (auto line = transport_->read_line()) {
        handle_line(*line);
    }
    stream_ended_.store(true);

    if (closing_.load()) {
        return;
    }

    const std::size_t failed =
        pending_.close(unavailable(server_name_, "output stream ended"));
    LOG_WARN("[" + server_name_ + "] output stream ended; failed " + std::to_string(failed) +
             " pending call(s)");
    if (on_closed_) {
        on_closed_(server_name_, "output stream ended");
    }
}

void ProtocolClient::handle_line(const std::string& line) {
    if (is_blank(line)) {
        return;
    }

    auto parsed = protocol::parse_message(line);
    if (core::errors::is_error(parsed)) {
        LOG_WARN("[" + server_name_ + "] skipping malformed line (" +
                 core::errors::get_error(parsed).message + "): " + clip(line));
        return;
    }
    JsonRpcMessage message = std::move(core::errors::get_value(parsed));

    switch (message.kind) {
        case JsonRpcMessage::Kind::Notification:
            LOG_DEBUG("[" + server_name_ + "] notification " + message.method);
            return;
        case JsonRpcMessage::Kind::Request:
            answer_server_request(message);
            return;
        case JsonRpcMessage::Kind::Response:
            break;
    }

    const auto id = message.numeric_id();
    if (!id.has_value()) {
        ++discarded_responses_;
        LOG_WARN("[" + server_name_ + "] discarding response with non-integer id: " +
                 clip(line));
        return;
    }
    if (!pending_.complete(id.value(), std::move(message))) {
        ++discarded_responses_;
        LOG_WARN("[" + server_name_ + "] discarding response for unknown or expired id " +
                 std::to_string(id.value()));
    }
}

void ProtocolClient::answer_server_request(const JsonRpcMessage& request) {
    json reply;
    if (request.method == "ping") {
        reply = protocol::make_result_response(request.id.value(), json::object());
    } else {
        LOG_DEBUG("[" + server_name_ + "] rejecting server request " + request.method);
        reply = protocol::make_error_response(
            request.id.value(),
            protocol::JsonRpcError{protocol::kMethodNotFound,
                                   "Method not found: " + request.method, json()});
    }

    auto sent = send(reply, std::chrono::steady_clock::now() + kDefaultWriteTimeout);
    if (core::errors::is_error(sent)) {
        LOG_WARN("[" + server_name_ + "] failed to answer " + request.method + ": " +
                 core::errors::get_error(sent).message);
    }
}

}  // namespace toolmux::runtime
