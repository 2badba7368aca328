#pragma once
#include "../tool.hpp"
#include <string>
#include <vector>
#include <utility>

namespace arena {

ToolPtr make_calculator_tool();
ToolPtr make_filesystem_tool(const std::string& base_path = ".");
ToolPtr make_web_tool();
ToolPtr make_data_analysis_tool();
ToolPtr make_time_tool();

// Evaluates an arithmetic expression. Throws ToolExecutionError.
double evaluate_expression(const std::string& expression);
std::string format_number(double value);

// Default set in registration order: calculator, filesystem, web,
// data_analysis, time.
std::vector<std::pair<std::string, ToolFactory>> builtin_tool_factories();

} // namespace arena
