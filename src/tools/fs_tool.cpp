#include "builtin_tools.hpp"
#include "../errors.hpp"
#include "../utils.hpp"
#include <fstream>
#include <vector>

namespace arena {

static std::string resolve_base_path(const std::string& base, const std::string& path) {
    if (!path.empty() && path[0] == '/') return path;
    std::string b = base.empty() ? "." : base;
    if (b.back() != '/') b += '/';
    return b + path;
}

ToolPtr make_filesystem_tool(const std::string& base_path) {
    auto base = std::make_shared<std::string>(base_path);

    ToolDef def;
    def.name = "filesystem";
    def.description = "Perform file system operations like read, write, list files";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "operation": {"type": "string", "enum": ["read", "write", "list", "exists"]},
            "path": {"type": "string"},
            "content": {"type": "string"}
        },
        "required": ["operation", "path"]
    })JSON");

    def.func = [base](const nlohmann::json& args) -> std::string {
        std::string operation = args.value("operation", "");
        std::string path = args.value("path", "");
        if (path.empty()) throw ToolExecutionError("path is required");

        std::string full = resolve_base_path(*base, path);
        std::error_code ec;

        if (operation == "read") {
            if (!fs::is_regular_file(full, ec)) throw ToolExecutionError("File not found: " + full);
            std::ifstream f(full);
            if (!f) throw ToolExecutionError("Cannot read file: " + full);
            std::ostringstream ss;
            ss << f.rdbuf();
            return ss.str();
        }
        if (operation == "write") {
            auto parent = fs::path(full).parent_path();
            if (!parent.empty()) fs::create_directories(parent, ec);
            std::ofstream f(full);
            if (!f) throw ToolExecutionError("Cannot write file: " + full);
            f << args.value("content", "");
            return "Successfully wrote to: " + full;
        }
        if (operation == "list") {
            if (!fs::is_directory(full, ec)) throw ToolExecutionError("Directory not found: " + full);
            std::vector<std::string> items;
            for (auto& entry : fs::directory_iterator(full, ec)) {
                items.push_back(entry.path().filename().string());
            }
            std::sort(items.begin(), items.end());
            std::string out = "Contents of " + full + ":";
            for (auto& item : items) out += "\n" + item;
            return out;
        }
        if (operation == "exists") {
            return std::string("Path exists: ") + (fs::exists(full, ec) ? "true" : "false");
        }
        throw ToolExecutionError("Unsupported operation: " + operation);
    };
    return std::make_shared<FunctionTool>(std::move(def));
}

} // namespace arena
