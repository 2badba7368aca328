#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena {

struct ProviderConfig {
    std::string api_key;
    std::string api_base = "http://127.0.0.1:8000/v1";
    int max_retries = 3;             // retryable provider errors
};

struct MemoryConfig {
    std::string type = "conversation";  // simple | conversation | episodic
    int max_history = 100;              // conversation capacity (turns)
    std::string db_path = ":memory:";   // episodic sqlite database
};

struct AgentConfig {
    std::string strategy = "react";
    int max_steps = 10;
    int max_reflections = 3;
    int max_replans = 2;

    // Sampling parameters, forwarded to the generator
    std::string model = "gpt-4.1-mini";
    double temperature = 0.7;
    int max_tokens = 2048;

    // 0 = unbounded
    int tool_timeout_ms = 0;
    int generation_timeout_ms = 0;

    MemoryConfig memory;
    std::vector<std::string> tools;     // names in the process-wide registry
    std::vector<std::string> policies;  // safety | content_filter | tool_allowlist
    ProviderConfig provider;
    bool verbose = false;

    static AgentConfig load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static AgentConfig from_json(const nlohmann::json& j);
};

} // namespace arena
