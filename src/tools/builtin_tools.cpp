#include "builtin_tools.hpp"

namespace arena {

std::vector<std::pair<std::string, ToolFactory>> builtin_tool_factories() {
    return {
        {"calculator",    [] { return make_calculator_tool(); }},
        {"filesystem",    [] { return make_filesystem_tool("."); }},
        {"web",           [] { return make_web_tool(); }},
        {"data_analysis", [] { return make_data_analysis_tool(); }},
        {"time",          [] { return make_time_tool(); }},
    };
}

} // namespace arena
