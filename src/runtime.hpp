#pragma once
#include "deadline.hpp"
#include "generator.hpp"
#include "policy.hpp"
#include "tool_registry.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arena {

// Markers the strategies look for in generated text.
constexpr const char* kNoFurtherImprovement = "NO_FURTHER_IMPROVEMENT";
constexpr const char* kPlanBlocked = "PLAN_BLOCKED";

// Everything a state machine needs for one process() call.
struct RunContext {
    std::shared_ptr<Generator> generator;
    SamplingParams sampling;
    std::shared_ptr<ToolRegistry> tools;
    std::shared_ptr<PolicyChain> policies;
    CancelTokenPtr cancel;
    std::chrono::milliseconds tool_timeout{0};
    std::chrono::milliseconds generation_timeout{0};
    bool verbose = false;

    // Deadline-bounded generation. Throws GenerationError, TimeoutError or
    // CancelledError.
    std::string generate(const std::string& prompt, const std::vector<Message>& context) const;

    void log_step(const char* strategy, const std::string& step, const std::string& detail = "") const;
};

enum class ActionStatus { ok, rejected, not_found, failed, timeout, cancelled };

const char* action_status_name(ActionStatus s);

struct ActionOutcome {
    ActionStatus status = ActionStatus::ok;
    ToolAction action;       // as executed, after policy rewrites
    std::string text;        // tool result or error explanation
    bool invoked = false;    // the tool's execute() was called

    bool ok() const { return status == ActionStatus::ok; }
};

// Policy-gated tool call shared by ReAct ACT and Planning EXECUTE_STEP.
// Never throws: every failure becomes an outcome.
ActionOutcome invoke_action(const RunContext& ctx, const ToolAction& action);

// One parsed generation in the Thought / Action / Action Input / Final Answer
// format.
struct ParsedOutput {
    std::string thought;
    std::optional<ToolAction> action;
    std::optional<std::string> final_answer;
};

ParsedOutput parse_agent_output(const std::string& text);

// Numbered or bulleted lines become steps; plain non-empty lines otherwise.
std::vector<std::string> parse_plan(const std::string& text);

} // namespace arena
