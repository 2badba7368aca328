#include "search_tool.hpp"
#include "../errors.hpp"

namespace arena {

SearchTool::SearchTool(SearchFunction fn) : fn_(std::move(fn)) {
    schema_ = {
        {"type", "object"},
        {"properties", {{"query", {{"type", "string"}}}}},
        {"required", {"query"}}
    };
}

std::string SearchTool::execute(const nlohmann::json& args) {
    std::string query = args.is_object() ? args.value("query", args.value("input", "")) : "";
    if (query.empty()) throw ToolExecutionError("query is required");
    try {
        return nlohmann::json(fn_(query)).dump();
    } catch (const ToolExecutionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ToolExecutionError(std::string("Search error: ") + e.what());
    }
}

} // namespace arena
