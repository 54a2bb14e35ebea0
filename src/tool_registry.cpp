#include "llmtools/tool_registry.hpp"
#include <mutex>
#include <stdexcept>

namespace llmtools {

void ToolRegistry::add(ToolDefinition def, ToolHandler handler) {
    if (def.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null: " + def.name);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string name = def.name;
    entries_[name] = Entry{std::move(def), std::move(handler)};
}

bool ToolRegistry::remove(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return entries_.erase(name) > 0;
}

std::vector<ToolDefinition> ToolRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ToolDefinition> tools;
    tools.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        tools.push_back(entry.definition);
    }
    return tools;
}

std::optional<ToolHandler> ToolRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second.handler;
}

bool ToolRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(name) > 0;
}

std::size_t ToolRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace llmtools
