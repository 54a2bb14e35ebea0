#pragma once
#include "types.hpp"
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmtools {

/// Tool implementation. Returns the text shown to the client; reports a
/// failure by throwing (ToolError or any std::exception).
using ToolHandler = std::function<std::string(const nlohmann::json& arguments)>;

/// Name → (definition, handler) map shared between setup code and the
/// dispatch loop. Lookups take a shared lock, mutations an exclusive one.
class ToolRegistry {
public:
    /// Register or replace the tool named def.name.
    /// Throws std::invalid_argument for an empty name or handler.
    void add(ToolDefinition def, ToolHandler handler);

    /// Returns false if no tool had that name.
    bool remove(const std::string& name);

    /// Snapshot of all definitions, in no particular order.
    [[nodiscard]] std::vector<ToolDefinition> list() const;

    [[nodiscard]] std::optional<ToolHandler> find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        ToolDefinition definition;
        ToolHandler handler;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace llmtools
