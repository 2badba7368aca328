#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <nlohmann/json.hpp>

namespace arena {

// Maps tool names to factories or instances. Registration order is kept:
// listing, help text and the tool spec all follow it. All methods are
// internally synchronized.
class ToolRegistry {
public:
    // Fails with DuplicateToolError when the name is taken, unless
    // allow_override is set (the entry keeps its original position).
    void register_factory(const std::string& name, ToolFactory factory, bool allow_override = false);
    void register_tool(ToolPtr tool, bool allow_override = false);
    void register_tool(ToolDef def, bool allow_override = false);

    bool has(const std::string& name) const;

    // Instantiates from the factory on first use. Throws ToolNotFoundError.
    ToolPtr get(const std::string& name);

    std::vector<std::string> list() const;
    std::vector<ToolPtr> instances();

    // Instantiates every built-in tool with default configuration and
    // registers any that are missing.
    std::vector<ToolPtr> create_default_set();

    std::string execute(const std::string& name, const nlohmann::json& args);

    // One "name: description" line per tool, registration order.
    std::string help_text();
    nlohmann::json tools_spec();

    size_t size() const;

    // Process-wide registry, initialized with the built-in factories.
    static ToolRegistry& global();

private:
    struct Entry {
        std::string name;
        ToolFactory factory;
        ToolPtr instance;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;

    void put_locked(Entry entry, bool allow_override);
    ToolPtr instance_locked(Entry& entry);
};

} // namespace arena
