#pragma once
#include "config.hpp"
#include "deadline.hpp"
#include "generator.hpp"
#include "memory.hpp"
#include "policy.hpp"
#include "runtime.hpp"
#include "state.hpp"
#include "tool_registry.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena {

// One strategy wired to a generator, memory, tools and policies.
//
// process() may be called concurrently; each call owns a fresh AgentState.
// Memory, tools and policies are shared between calls.
class Agent {
public:
    // Throws ConfigError when generator is null or the memory config is bad.
    Agent(Strategy strategy, AgentConfig config, std::shared_ptr<Generator> generator,
          MemoryPtr memory = nullptr);

    // Never throws; failures come back as text starting with "[error]".
    std::string process(const std::string& input);

    // Continues a state produced by get_state(). Throws ConfigError on a
    // malformed state or one from a different strategy.
    std::string resume(const nlohmann::json& state);

    // Throws DuplicateToolError when the name is taken.
    void add_tool(ToolPtr tool);
    void add_policy(PolicyPtr policy);
    void set_memory(MemoryPtr memory);
    MemoryPtr memory() const;

    // Serialized state of the most recent run, null before the first.
    nlohmann::json get_state() const;
    nlohmann::json get_compiled_graph() const;

    // Aborts the suspension point of every in-flight process() call.
    void cancel();

    Strategy strategy() const { return strategy_; }
    const AgentConfig& config() const { return config_; }
    ToolRegistry& tools() { return *tools_; }
    PolicyChain& policies() { return *policies_; }

private:
    Strategy strategy_;
    AgentConfig config_;
    std::shared_ptr<Generator> generator_;
    std::shared_ptr<ToolRegistry> tools_;
    std::shared_ptr<PolicyChain> policies_;

    mutable std::mutex mutex_;
    MemoryPtr memory_;
    nlohmann::json last_state_;
    std::vector<CancelTokenPtr> active_;

    RunContext make_context(CancelTokenPtr token) const;
    AgentState fresh_state(const std::string& input, const std::string& memory_context) const;
    std::string execute(AgentState state);
    void run_state(AgentState& state, const RunContext& ctx) const;

    CancelTokenPtr begin_call();
    void end_call(const CancelTokenPtr& token);
};

using AgentPtr = std::shared_ptr<Agent>;

} // namespace arena
