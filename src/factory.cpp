#include "factory.hpp"
#include "errors.hpp"
#include "provider.hpp"
#include "tool_registry.hpp"

namespace arena {

static std::shared_ptr<Generator> default_generator(const AgentConfig& config,
                                                    std::shared_ptr<Generator> generator) {
    if (generator) return generator;
    return std::make_shared<ProviderGenerator>(config.provider);
}

// Tools by name from the process-wide registry, policies by name.
static void wire_named(Agent& agent, const AgentConfig& config) {
    for (auto& name : config.tools) {
        agent.add_tool(ToolRegistry::global().get(name));
    }
    for (auto& name : config.policies) {
        agent.add_policy(make_policy(name, config));
    }
}

// ── AgentFactory ───────────────────────────────────────────────────────

AgentPtr AgentFactory::create_agent(const std::string& strategy_name, const AgentConfig& config,
                                    std::shared_ptr<Generator> generator) {
    Strategy strategy = parse_strategy(strategy_name);
    auto agent = std::make_shared<Agent>(strategy, config, default_generator(config, std::move(generator)));
    wire_named(*agent, config);
    return agent;
}

AgentPtr AgentFactory::create_agent(const nlohmann::json& config, std::shared_ptr<Generator> generator) {
    AgentConfig cfg = AgentConfig::from_json(config);
    return create_agent(cfg.strategy, cfg, std::move(generator));
}

std::vector<std::string> AgentFactory::strategies() {
    return {"reflection", "react", "planning"};
}

// ── AgentBuilder ───────────────────────────────────────────────────────

AgentBuilder& AgentBuilder::with_strategy(const std::string& name) {
    strategy_ = name;
    return *this;
}

AgentBuilder& AgentBuilder::with_config(const nlohmann::json& patch) {
    nlohmann::json merged = config_.to_json();
    merged.merge_patch(patch);
    config_ = AgentConfig::from_json(merged);
    if (patch.is_object() && patch.contains("strategy") && patch["strategy"].is_string()) {
        strategy_ = patch["strategy"].get<std::string>();
    }
    return *this;
}

AgentBuilder& AgentBuilder::with_memory(const std::string& type, int max_history) {
    config_.memory.type = type;
    config_.memory.max_history = max_history;
    memory_.reset();
    return *this;
}

AgentBuilder& AgentBuilder::with_memory(MemoryPtr memory) {
    memory_ = std::move(memory);
    return *this;
}

AgentBuilder& AgentBuilder::with_tool(ToolPtr tool) {
    tools_.push_back(std::move(tool));
    return *this;
}

AgentBuilder& AgentBuilder::with_tool(const std::string& name) {
    config_.tools.push_back(name);
    return *this;
}

AgentBuilder& AgentBuilder::with_policy(PolicyPtr policy) {
    policies_.push_back(std::move(policy));
    return *this;
}

AgentBuilder& AgentBuilder::with_policy(const std::string& name) {
    config_.policies.push_back(name);
    return *this;
}

AgentBuilder& AgentBuilder::with_max_steps(int n) { config_.max_steps = n; return *this; }
AgentBuilder& AgentBuilder::with_max_reflections(int n) { config_.max_reflections = n; return *this; }
AgentBuilder& AgentBuilder::with_max_replans(int n) { config_.max_replans = n; return *this; }
AgentBuilder& AgentBuilder::with_model(const std::string& model) { config_.model = model; return *this; }
AgentBuilder& AgentBuilder::with_temperature(double t) { config_.temperature = t; return *this; }
AgentBuilder& AgentBuilder::with_max_tokens(int n) { config_.max_tokens = n; return *this; }
AgentBuilder& AgentBuilder::with_verbose(bool v) { config_.verbose = v; return *this; }

AgentBuilder& AgentBuilder::with_timeouts(int tool_ms, int generation_ms) {
    config_.tool_timeout_ms = tool_ms;
    config_.generation_timeout_ms = generation_ms;
    return *this;
}

AgentBuilder& AgentBuilder::with_generator(std::shared_ptr<Generator> generator) {
    generator_ = std::move(generator);
    return *this;
}

std::unique_ptr<Agent> AgentBuilder::build() const {
    Strategy strategy = parse_strategy(strategy_);

    if (config_.max_steps < 0 || config_.max_reflections < 0 || config_.max_replans < 0) {
        throw ConfigError("iteration bounds must be non-negative");
    }
    if (config_.memory.max_history < 1) {
        throw ConfigError("memory.max_history must be at least 1");
    }

    auto agent = std::make_unique<Agent>(strategy, config_, default_generator(config_, generator_),
                                         memory_);
    for (auto& t : tools_) agent->add_tool(t);
    for (auto& p : policies_) agent->add_policy(p);
    wire_named(*agent, config_);
    return agent;
}

// ── AgentPresets ───────────────────────────────────────────────────────

AgentPresets::AgentPresets() {
    AgentConfig reflection;
    reflection.strategy = "reflection";
    reflection.max_reflections = 2;
    reflection.memory.type = "conversation";
    reflection.policies = {"content_filter"};
    presets_["basic_reflection"] = reflection;

    AgentConfig react;
    react.strategy = "react";
    react.max_steps = 8;
    react.temperature = 0.2;
    react.tools = {"calculator", "time", "data_analysis"};
    react.policies = {"safety"};
    presets_["tool_react"] = react;

    AgentConfig planner;
    planner.strategy = "planning";
    planner.max_steps = 20;
    planner.max_replans = 3;
    planner.memory.type = "episodic";
    planner.tools = {"calculator", "filesystem", "data_analysis"};
    planner.policies = {"safety", "content_filter"};
    presets_["deep_planner"] = planner;
}

void AgentPresets::register_preset(const std::string& name, const AgentConfig& config) {
    parse_strategy(config.strategy);
    presets_[name] = config;
}

bool AgentPresets::has(const std::string& name) const {
    return presets_.count(name) > 0;
}

const AgentConfig& AgentPresets::get(const std::string& name) const {
    auto it = presets_.find(name);
    if (it == presets_.end()) throw NotFoundError("Unknown preset: " + name);
    return it->second;
}

std::vector<std::string> AgentPresets::names() const {
    std::vector<std::string> out;
    for (auto& [name, cfg] : presets_) out.push_back(name);
    return out;
}

AgentPtr AgentPresets::create_from_preset(const std::string& name,
                                          std::shared_ptr<Generator> generator) const {
    const AgentConfig& cfg = get(name);
    return AgentFactory::create_agent(cfg.strategy, cfg, std::move(generator));
}

} // namespace arena
