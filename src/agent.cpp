#include "agent.hpp"
#include "errors.hpp"
#include "planning_machine.hpp"
#include "react_machine.hpp"
#include "reflection_machine.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>

namespace arena {

Agent::Agent(Strategy strategy, AgentConfig config, std::shared_ptr<Generator> generator,
             MemoryPtr memory)
    : strategy_(strategy)
    , config_(std::move(config))
    , generator_(std::move(generator))
    , tools_(std::make_shared<ToolRegistry>())
    , policies_(std::make_shared<PolicyChain>())
    , memory_(std::move(memory))
{
    if (!generator_) throw ConfigError("agent requires a generator");
    if (!memory_) memory_ = make_memory(config_.memory);
    config_.strategy = strategy_name(strategy_);
}

void Agent::add_tool(ToolPtr tool) {
    tools_->register_tool(std::move(tool));
}

void Agent::add_policy(PolicyPtr policy) {
    policies_->add(std::move(policy));
}

void Agent::set_memory(MemoryPtr memory) {
    std::lock_guard<std::mutex> lk(mutex_);
    memory_ = std::move(memory);
}

MemoryPtr Agent::memory() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return memory_;
}

nlohmann::json Agent::get_state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return last_state_;
}

nlohmann::json Agent::get_compiled_graph() const {
    return describe_graph(strategy_);
}

void Agent::cancel() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& t : active_) t->cancel();
}

CancelTokenPtr Agent::begin_call() {
    auto token = std::make_shared<CancelToken>();
    std::lock_guard<std::mutex> lk(mutex_);
    active_.push_back(token);
    return token;
}

void Agent::end_call(const CancelTokenPtr& token) {
    std::lock_guard<std::mutex> lk(mutex_);
    active_.erase(std::remove(active_.begin(), active_.end(), token), active_.end());
}

RunContext Agent::make_context(CancelTokenPtr token) const {
    RunContext ctx;
    ctx.generator = generator_;
    ctx.sampling.model = config_.model;
    ctx.sampling.temperature = config_.temperature;
    ctx.sampling.max_tokens = config_.max_tokens;
    ctx.tools = tools_;
    ctx.policies = policies_;
    ctx.cancel = std::move(token);
    ctx.tool_timeout = std::chrono::milliseconds(config_.tool_timeout_ms);
    ctx.generation_timeout = std::chrono::milliseconds(config_.generation_timeout_ms);
    ctx.verbose = config_.verbose;
    return ctx;
}

AgentState Agent::fresh_state(const std::string& input, const std::string& memory_context) const {
    switch (strategy_) {
        case Strategy::reflection:
            return ReflectionMachine::initial_state(input, memory_context, config_.max_reflections);
        case Strategy::react:
            return ReactMachine::initial_state(input, memory_context, config_.max_steps);
        case Strategy::planning:
            return PlanningMachine::initial_state(input, memory_context,
                                                  config_.max_steps, config_.max_replans);
    }
    throw UnknownStrategyError(strategy_name(strategy_));
}

void Agent::run_state(AgentState& state, const RunContext& ctx) const {
    switch (strategy_) {
        case Strategy::reflection:
            ReflectionMachine(ctx).run(std::get<ReflectionState>(state));
            break;
        case Strategy::react:
            ReactMachine(ctx).run(std::get<ReActState>(state));
            break;
        case Strategy::planning:
            PlanningMachine(ctx).run(std::get<PlanningState>(state));
            break;
    }
}

// ── process ────────────────────────────────────────────────────────────

std::string Agent::process(const std::string& input) {
    MemoryPtr mem = memory();
    std::string memory_context;
    if (mem) {
        try {
            memory_context = mem->get_context(input);
        } catch (const std::exception& e) {
            std::cerr << "[agent] memory context unavailable: " << e.what() << "\n";
        }
    }

    try {
        return execute(fresh_state(input, memory_context));
    } catch (const std::exception& e) {
        std::cerr << "[agent] process failed: " << e.what() << "\n";
        return std::string("[error] ") + e.what();
    }
}

std::string Agent::resume(const nlohmann::json& state) {
    AgentState restored = state_from_json(state);
    if (state_strategy(restored) != strategy_) {
        throw ConfigError(std::string("cannot resume a ") + strategy_name(state_strategy(restored)) +
                          " state on a " + strategy_name(strategy_) + " agent");
    }
    try {
        return execute(std::move(restored));
    } catch (const std::exception& e) {
        std::cerr << "[agent] resume failed: " << e.what() << "\n";
        return std::string("[error] ") + e.what();
    }
}

std::string Agent::execute(AgentState state) {
    CancelTokenPtr token = begin_call();
    struct CallGuard {
        Agent* agent;
        CancelTokenPtr token;
        ~CallGuard() { agent->end_call(token); }
    } guard{this, token};

    RunContext ctx = make_context(token);
    run_state(state, ctx);

    StateBase& base = state_base(state);
    base.output = policies_->filter_response(base.output);

    {
        std::lock_guard<std::mutex> lk(mutex_);
        last_state_ = state_to_json(state);
    }

    Interaction interaction;
    interaction.input = base.input;
    interaction.output = base.output;
    interaction.strategy = strategy_name(strategy_);
    interaction.success = base.errors.empty() && !starts_with(base.output, "[error]");
    if (auto* r = std::get_if<ReActState>(&state)) interaction.tools_used = r->tools_used;
    if (auto* p = std::get_if<PlanningState>(&state)) interaction.tools_used = p->tools_used;

    MemoryPtr mem = memory();
    if (mem) {
        try {
            mem->record_interaction(interaction);
        } catch (const std::exception& e) {
            std::cerr << "[agent] memory update failed: " << e.what() << "\n";
        }
    }
    return base.output;
}

} // namespace arena
