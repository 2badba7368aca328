#pragma once
#include "agent.hpp"
#include "generator.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena {

// Picks a strategy per input and forwards to a cached agent for it.
class AgentRouter {
public:
    AgentRouter(std::shared_ptr<Generator> generator, AgentConfig base = {});

    // Arithmetic or tool verbs -> react; plan/steps/organize -> planning;
    // anything else -> reflection.
    static Strategy route(const std::string& input);

    // Built on first use, then reused. Throws on configuration errors.
    AgentPtr agent_for(Strategy strategy);

    std::string process(const std::string& input);

private:
    std::shared_ptr<Generator> generator_;
    AgentConfig base_;
    std::mutex mutex_;
    std::map<Strategy, AgentPtr> agents_;
};

// Router whose agents carry the calculator, time and data_analysis tools
// behind the safety policy.
std::unique_ptr<AgentRouter> create_default_router(std::shared_ptr<Generator> generator);

struct WorkflowStage {
    std::string key;     // "<index>:<agent>"
    std::string agent;
    std::string output;
};

struct WorkflowResult {
    std::vector<WorkflowStage> stages;
    std::string final_output;

    nlohmann::json to_json() const;
};

// Named agents chained into named workflows; each stage receives the
// previous stage's output.
class MultiAgentOrchestrator {
public:
    void add_agent(const std::string& name, AgentPtr agent);
    bool has_agent(const std::string& name) const;
    // Throws NotFoundError.
    AgentPtr agent(const std::string& name) const;

    // Throws NotFoundError for an unknown agent, ConfigError for an empty list.
    void define_workflow(const std::string& name, std::vector<std::string> agents);
    std::vector<std::string> workflows() const;

    // Throws NotFoundError for an unknown workflow.
    WorkflowResult execute_workflow(const std::string& name, const std::string& input);

private:
    mutable std::mutex mutex_;
    std::map<std::string, AgentPtr> agents_;
    std::map<std::string, std::vector<std::string>> workflows_;
};

} // namespace arena
