#include "builtin_tools.hpp"
#include "../errors.hpp"
#include <httplib.h>
#include <memory>
#include <stdexcept>

namespace arena {

static constexpr size_t kMaxFetchChars = 2000;

// Splits "scheme://host[:port]/path?query" into the client origin and request path.
static void split_url(const std::string& url, std::string& origin, std::string& path) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) throw ToolExecutionError("URL must include a scheme: " + url);
    size_t slash = url.find('/', scheme_end + 3);
    if (slash == std::string::npos) {
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, slash);
        path = url.substr(slash);
    }
}

ToolPtr make_web_tool() {
    ToolDef def;
    def.name = "web";
    def.description = "Perform web operations like fetch webpage content";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "operation": {"type": "string", "enum": ["fetch", "headers"]},
            "url": {"type": "string"}
        },
        "required": ["operation", "url"]
    })JSON");

    def.func = [](const nlohmann::json& args) -> std::string {
        std::string operation = args.value("operation", "fetch");
        std::string url = args.value("url", "");
        if (url.empty()) throw ToolExecutionError("url is required");
        if (operation != "fetch" && operation != "headers") {
            throw ToolExecutionError("Unsupported web operation: " + operation);
        }

        std::string origin, path;
        split_url(url, origin, path);

        std::unique_ptr<httplib::Client> client;
        try {
            client = std::make_unique<httplib::Client>(origin);
        } catch (const std::invalid_argument& e) {
            throw ToolExecutionError("Unsupported URL: " + url + ": " + e.what());
        }
        if (!client->is_valid()) throw ToolExecutionError("Unsupported URL: " + url);
        httplib::Client& cli = *client;
        cli.set_connection_timeout(10);
        cli.set_read_timeout(10);
        cli.set_follow_location(true);

        auto res = (operation == "fetch") ? cli.Get(path) : cli.Head(path);
        if (!res) {
            throw ToolExecutionError("Web operation error: " + httplib::to_string(res.error()));
        }
        if (res->status >= 400) {
            throw ToolExecutionError("Web operation error: HTTP " + std::to_string(res->status));
        }

        if (operation == "fetch") {
            return res->body.substr(0, kMaxFetchChars);
        }
        nlohmann::json headers = nlohmann::json::object();
        for (auto& [k, v] : res->headers) headers[k] = v;
        return headers.dump();
    };
    return std::make_shared<FunctionTool>(std::move(def));
}

} // namespace arena
