#include "tool_registry.hpp"
#include "errors.hpp"
#include "tools/builtin_tools.hpp"
#include <iostream>
#include <mutex>

namespace arena {

void ToolRegistry::put_locked(Entry entry, bool allow_override) {
    auto it = index_.find(entry.name);
    if (it != index_.end()) {
        if (!allow_override) throw DuplicateToolError(entry.name);
        entries_[it->second] = std::move(entry);
        return;
    }
    index_[entry.name] = entries_.size();
    entries_.push_back(std::move(entry));
}

ToolPtr ToolRegistry::instance_locked(Entry& entry) {
    if (!entry.instance) {
        entry.instance = entry.factory();
        if (!entry.instance) throw ToolExecutionError("factory for '" + entry.name + "' returned no tool");
    }
    return entry.instance;
}

void ToolRegistry::register_factory(const std::string& name, ToolFactory factory, bool allow_override) {
    std::lock_guard<std::mutex> lock(mutex_);
    put_locked(Entry{name, std::move(factory), nullptr}, allow_override);
}

void ToolRegistry::register_tool(ToolPtr tool, bool allow_override) {
    if (!tool) throw ToolExecutionError("cannot register a null tool");
    std::string name = tool->name();
    ToolPtr shared = tool;
    std::lock_guard<std::mutex> lock(mutex_);
    put_locked(Entry{name, [shared]() { return shared; }, tool}, allow_override);
}

void ToolRegistry::register_tool(ToolDef def, bool allow_override) {
    register_tool(std::make_shared<FunctionTool>(std::move(def)), allow_override);
}

bool ToolRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(name) > 0;
}

ToolPtr ToolRegistry::get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) throw ToolNotFoundError(name);
    return instance_locked(entries_[it->second]);
}

std::vector<std::string> ToolRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (auto& e : entries_) names.push_back(e.name);
    return names;
}

std::vector<ToolPtr> ToolRegistry::instances() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolPtr> out;
    out.reserve(entries_.size());
    for (auto& e : entries_) out.push_back(instance_locked(e));
    return out;
}

std::vector<ToolPtr> ToolRegistry::create_default_set() {
    std::vector<ToolPtr> tools;
    for (auto& [name, factory] : builtin_tool_factories()) {
        ToolPtr tool = factory();
        tools.push_back(tool);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(name);
        if (it == index_.end()) {
            put_locked(Entry{name, factory, tool}, false);
        } else if (!entries_[it->second].instance) {
            entries_[it->second].instance = tool;
        }
    }
    return tools;
}

std::string ToolRegistry::execute(const std::string& name, const nlohmann::json& args) {
    return get(name)->execute(args);
}

std::string ToolRegistry::help_text() {
    std::string text;
    for (auto& tool : instances()) {
        text += "- " + tool->help_line() + "\n";
    }
    return text;
}

nlohmann::json ToolRegistry::tools_spec() {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& tool : instances()) {
        arr.push_back({
            {"name", tool->name()},
            {"description", tool->description()},
            {"parameters", tool->schema()}
        });
    }
    return arr;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

ToolRegistry& ToolRegistry::global() {
    static ToolRegistry registry;
    static std::once_flag seeded;
    std::call_once(seeded, [] {
        for (auto& [name, factory] : builtin_tool_factories()) {
            registry.register_factory(name, factory);
        }
    });
    return registry;
}

} // namespace arena
