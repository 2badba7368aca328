#include "builtin_tools.hpp"
#include "../utils.hpp"

namespace arena {

ToolPtr make_time_tool() {
    ToolDef def;
    def.name = "time";
    def.description = "Get the current time";
    def.parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    def.func = [](const nlohmann::json&) -> std::string { return iso_time_now(); };
    return std::make_shared<FunctionTool>(std::move(def));
}

} // namespace arena
