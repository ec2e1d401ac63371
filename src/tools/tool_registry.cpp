#include "tools/tool_registry.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolmux::tools {

using protocol::ToolDescriptor;

RegistrationOutcome ToolRegistry::register_tool(ToolDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(descriptor.name);
    if (it != index_.end()) {
        ToolConflict conflict{descriptor.name, tools_[it->second].server_name,
                              descriptor.server_name};
        LOG_WARN("ToolRegistry: tool " + conflict.tool_name + " from " +
                 conflict.rejected_server + " conflicts with " + conflict.kept_server +
                 "; keeping the first registration");
        conflicts_.push_back(std::move(conflict));
        return RegistrationOutcome::Conflict;
    }

    LOG_DEBUG("ToolRegistry: registered " + descriptor.name + " from " +
              descriptor.server_name);
    index_.emplace(descriptor.name, tools_.size());
    tools_.push_back(std::move(descriptor));
    return RegistrationOutcome::Registered;
}

std::vector<ToolDescriptor> ToolRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

std::optional<ToolDescriptor> ToolRegistry::lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return tools_[it->second];
}

std::size_t ToolRegistry::evict(const std::string& server_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = tools_.size();
    tools_.erase(std::remove_if(tools_.begin(), tools_.end(),
                                [&server_name](const ToolDescriptor& tool) {
                                    return tool.server_name == server_name;
                                }),
                 tools_.end());
    const auto removed = before - tools_.size();
    if (removed > 0) {
        reindex();
        LOG_INFO("ToolRegistry: evicted " + std::to_string(removed) + " tool(s) of " +
                 server_name);
    }
    return removed;
}

std::vector<ToolConflict> ToolRegistry::conflicts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conflicts_;
}

std::size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

std::size_t ToolRegistry::count_for(const std::string& server_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(tools_.begin(), tools_.end(), [&server_name](const ToolDescriptor& tool) {
            return tool.server_name == server_name;
        }));
}

void ToolRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_.clear();
    index_.clear();
    conflicts_.clear();
}

void ToolRegistry::reindex() {
    index_.clear();
    for (std::size_t i = 0; i < tools_.size(); ++i) {
        index_.emplace(tools_[i].name, i);
    }
}

}  // namespace toolmux::tools
