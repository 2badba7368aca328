#pragma once
#include "agent.hpp"
#include "config.hpp"
#include "generator.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena {

// Declarative construction. Configuration mistakes (unknown strategy, tool,
// policy or memory type) surface here as exceptions.
class AgentFactory {
public:
    // A null generator means a ProviderGenerator built from config.provider.
    static AgentPtr create_agent(const std::string& strategy_name, const AgentConfig& config,
                                 std::shared_ptr<Generator> generator = nullptr);
    // Strategy taken from config["strategy"].
    static AgentPtr create_agent(const nlohmann::json& config,
                                 std::shared_ptr<Generator> generator = nullptr);

    static std::vector<std::string> strategies();
};

// Fluent accumulation of agent settings; nothing is wired before build().
class AgentBuilder {
public:
    explicit AgentBuilder(std::string strategy = "react") : strategy_(std::move(strategy)) {}

    AgentBuilder& with_strategy(const std::string& name);
    AgentBuilder& with_config(const nlohmann::json& patch);  // merged over current settings

    AgentBuilder& with_memory(const std::string& type, int max_history = 100);
    AgentBuilder& with_memory(MemoryPtr memory);

    AgentBuilder& with_tool(ToolPtr tool);
    AgentBuilder& with_tool(const std::string& name);  // from the global registry
    AgentBuilder& with_policy(PolicyPtr policy);
    AgentBuilder& with_policy(const std::string& name);

    AgentBuilder& with_max_steps(int n);
    AgentBuilder& with_max_reflections(int n);
    AgentBuilder& with_max_replans(int n);
    AgentBuilder& with_model(const std::string& model);
    AgentBuilder& with_temperature(double t);
    AgentBuilder& with_max_tokens(int n);
    AgentBuilder& with_timeouts(int tool_ms, int generation_ms);
    AgentBuilder& with_generator(std::shared_ptr<Generator> generator);
    AgentBuilder& with_verbose(bool v);

    // Throws UnknownStrategyError, ConfigError, ToolNotFoundError.
    std::unique_ptr<Agent> build() const;

private:
    std::string strategy_;
    AgentConfig config_;
    MemoryPtr memory_;
    std::vector<ToolPtr> tools_;
    std::vector<PolicyPtr> policies_;
    std::shared_ptr<Generator> generator_;
};

// Named configurations. Starts with basic_reflection, tool_react and
// deep_planner.
class AgentPresets {
public:
    AgentPresets();

    void register_preset(const std::string& name, const AgentConfig& config);
    bool has(const std::string& name) const;
    // Throws NotFoundError.
    const AgentConfig& get(const std::string& name) const;
    std::vector<std::string> names() const;

    // Throws NotFoundError.
    AgentPtr create_from_preset(const std::string& name,
                                std::shared_ptr<Generator> generator = nullptr) const;

private:
    std::map<std::string, AgentConfig> presets_;
};

} // namespace arena
