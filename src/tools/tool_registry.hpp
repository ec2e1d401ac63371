#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace toolmux::tools {

enum class RegistrationOutcome {
    Registered,
    Conflict
};

// A duplicate tool name that was turned away; the first registration stays.
struct ToolConflict {
    std::string tool_name;
    std::string kept_server;
    std::string rejected_server;
};

class ToolRegistry {
public:
    RegistrationOutcome register_tool(protocol::ToolDescriptor descriptor);

    // Snapshot in registration order.
    std::vector<protocol::ToolDescriptor> list() const;
    std::optional<protocol::ToolDescriptor> lookup(const std::string& name) const;

    // Removes every tool owned by `server_name`; returns how many.
    std::size_t evict(const std::string& server_name);

    std::vector<ToolConflict> conflicts() const;
    std::size_t size() const;
    std::size_t count_for(const std::string& server_name) const;
    void clear();

private:
    void reindex();

    mutable std::mutex mutex_;
    std::vector<protocol::ToolDescriptor> tools_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<ToolConflict> conflicts_;
};

}  // namespace toolmux::tools
