#include "builtin_tools.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <sstream>
#include <vector>

namespace arena {

static std::string summarize(const nlohmann::json& data) {
    if (data.is_string()) {
        std::string text = data.get<std::string>();
        std::istringstream words_in(text);
        std::string w;
        size_t words = 0;
        while (words_in >> w) words++;
        size_t lines = std::count(text.begin(), text.end(), '\n') + 1;
        return "Text summary: " + std::to_string(words) + " words, " +
               std::to_string(text.size()) + " characters, " +
               std::to_string(lines) + " lines";
    }
    if (data.is_array()) {
        return "List summary: " + std::to_string(data.size()) + " items";
    }
    return std::string("Data type: ") + data.type_name();
}

static std::string statistics(const nlohmann::json& data) {
    if (!data.is_array() || data.empty()) {
        throw ToolExecutionError("Statistics only available for numeric lists");
    }
    std::vector<double> xs;
    for (auto& v : data) {
        if (!v.is_number()) throw ToolExecutionError("Statistics only available for numeric lists");
        xs.push_back(v.get<double>());
    }
    std::sort(xs.begin(), xs.end());
    double sum = 0.0;
    for (double x : xs) sum += x;
    size_t n = xs.size();
    double median = (n % 2 == 1) ? xs[n / 2] : (xs[n / 2 - 1] + xs[n / 2]) / 2.0;

    nlohmann::json out = {
        {"count", n},
        {"mean", sum / static_cast<double>(n)},
        {"median", median},
        {"min", xs.front()},
        {"max", xs.back()}
    };
    return out.dump();
}

ToolPtr make_data_analysis_tool() {
    ToolDef def;
    def.name = "data_analysis";
    def.description = "Perform basic data analysis on provided data";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "operation": {"type": "string", "enum": ["summarize", "statistics"]},
            "data": {"type": ["string", "array"]}
        },
        "required": ["operation", "data"]
    })JSON");

    def.func = [](const nlohmann::json& args) -> std::string {
        std::string operation = args.value("operation", "");
        nlohmann::json data = args.contains("data") ? args["data"] : nlohmann::json();
        if (operation == "summarize") return summarize(data);
        if (operation == "statistics") return statistics(data);
        throw ToolExecutionError("Unsupported data operation: " + operation);
    };
    return std::make_shared<FunctionTool>(std::move(def));
}

} // namespace arena
