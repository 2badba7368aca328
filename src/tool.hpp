#pragma once
#include <string>
#include <memory>
#include <functional>
#include <nlohmann/json.hpp>

namespace arena {

// A proposed tool invocation: tool name plus arguments.
struct ToolAction {
    std::string name;
    nlohmann::json args = nlohmann::json::object();

    nlohmann::json to_json() const { return {{"name", name}, {"args", args}}; }

    static ToolAction from_json(const nlohmann::json& j) {
        ToolAction a;
        a.name = j.value("name", "");
        if (j.contains("args")) a.args = j["args"];
        return a;
    }
};

inline bool operator==(const ToolAction& a, const ToolAction& b) {
    return a.name == b.name && a.args == b.args;
}

// Named, schema-described unit of external capability. The schema is
// metadata only; execute() validates whatever it needs and raises
// ToolExecutionError on failure.
class Tool {
public:
    virtual ~Tool() = default;

    virtual const std::string& name() const = 0;
    virtual const std::string& description() const = 0;
    virtual const nlohmann::json& schema() const = 0;

    virtual std::string execute(const nlohmann::json& args) = 0;

    // "name: description", one line of help text
    std::string help_line() const { return name() + ": " + description(); }
};

using ToolFunction = std::function<std::string(const nlohmann::json&)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();
    ToolFunction func;
};

// Tool backed by a plain callable.
class FunctionTool : public Tool {
public:
    explicit FunctionTool(ToolDef def) : def_(std::move(def)) {}

    const std::string& name() const override { return def_.name; }
    const std::string& description() const override { return def_.description; }
    const nlohmann::json& schema() const override { return def_.parameters; }

    std::string execute(const nlohmann::json& args) override { return def_.func(args); }

private:
    ToolDef def_;
};

using ToolPtr = std::shared_ptr<Tool>;
using ToolFactory = std::function<ToolPtr()>;

} // namespace arena
