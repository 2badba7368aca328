#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>

namespace arena {

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

nlohmann::json AgentConfig::to_json() const {
    nlohmann::json j;
    j["strategy"] = strategy;
    j["max_steps"] = max_steps;
    j["max_reflections"] = max_reflections;
    j["max_replans"] = max_replans;
    j["model"] = model;
    j["temperature"] = temperature;
    j["max_tokens"] = max_tokens;
    j["tool_timeout_ms"] = tool_timeout_ms;
    j["generation_timeout_ms"] = generation_timeout_ms;

    j["memory"] = {
        {"type", memory.type},
        {"max_history", memory.max_history},
        {"db_path", memory.db_path}
    };
    j["tools"] = tools;
    j["policies"] = policies;

    j["provider"] = {{"api_base", provider.api_base}, {"max_retries", provider.max_retries}};
    if (!provider.api_key.empty()) j["provider"]["api_key"] = provider.api_key;

    if (verbose) j["verbose"] = true;
    return j;
}

AgentConfig AgentConfig::from_json(const nlohmann::json& j) {
    AgentConfig c;
    if (!j.is_object()) throw ConfigError("config must be a JSON object");

    try {
        c.strategy = j.value("strategy", c.strategy);
        c.max_steps = j.value("max_steps", c.max_steps);
        c.max_reflections = j.value("max_reflections", c.max_reflections);
        c.max_replans = j.value("max_replans", c.max_replans);
        c.model = j.value("model", c.model);
        c.temperature = j.value("temperature", c.temperature);
        c.max_tokens = j.value("max_tokens", c.max_tokens);
        c.tool_timeout_ms = j.value("tool_timeout_ms", c.tool_timeout_ms);
        c.generation_timeout_ms = j.value("generation_timeout_ms", c.generation_timeout_ms);
        c.verbose = j.value("verbose", c.verbose);

        if (j.contains("memory")) {
            auto& m = j["memory"];
            if (m.is_string()) {
                c.memory.type = m.get<std::string>();
            } else if (m.is_object()) {
                c.memory.type = m.value("type", c.memory.type);
                c.memory.max_history = m.value("max_history", c.memory.max_history);
                c.memory.db_path = m.value("db_path", c.memory.db_path);
            }
        }
        // Flat shorthand used by presets
        c.memory.type = j.value("memory_type", c.memory.type);
        c.memory.max_history = j.value("max_history", c.memory.max_history);

        if (j.contains("tools")) c.tools = parse_string_array(j["tools"]);
        if (j.contains("policies")) c.policies = parse_string_array(j["policies"]);

        if (j.contains("provider") && j["provider"].is_object()) {
            auto& p = j["provider"];
            c.provider.api_base = p.value("api_base", c.provider.api_base);
            c.provider.api_key = p.value("api_key", c.provider.api_key);
            c.provider.max_retries = p.value("max_retries", c.provider.max_retries);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    if (c.max_steps < 0 || c.max_reflections < 0 || c.max_replans < 0) {
        throw ConfigError("iteration bounds must be non-negative");
    }
    if (c.memory.max_history < 1) {
        throw ConfigError("memory.max_history must be at least 1");
    }
    return c;
}

AgentConfig AgentConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] " << path << " not found, using defaults\n";
        return AgentConfig{};
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }
    return from_json(j);
}

void AgentConfig::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) throw ConfigError("cannot write " + path);
    f << to_json().dump(2) << "\n";
}

} // namespace arena
