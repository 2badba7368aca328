#pragma once
#include "message.hpp"
#include "tool.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena {

enum class Strategy { reflection, react, planning };

const char* strategy_name(Strategy s);
// Throws UnknownStrategyError.
Strategy parse_strategy(const std::string& name);

// Step names. A state's phase is the next step to run.
namespace phase {
constexpr const char* kTerminate       = "TERMINATE";
// reflection
constexpr const char* kGenerateInitial = "GENERATE_INITIAL";
constexpr const char* kReflect         = "REFLECT";
constexpr const char* kRefine          = "REFINE";
// react
constexpr const char* kThink           = "THINK";
constexpr const char* kAct             = "ACT";
constexpr const char* kObserve         = "OBSERVE";
// planning
constexpr const char* kUnderstandGoal  = "UNDERSTAND_GOAL";
constexpr const char* kCreatePlan      = "CREATE_PLAN";
constexpr const char* kExecuteStep     = "EXECUTE_STEP";
constexpr const char* kEvaluate        = "EVALUATE";
constexpr const char* kReplan          = "REPLAN";
} // namespace phase

// Fields every strategy shares. Messages are append-only.
struct StateBase {
    std::string input;
    std::string memory_context;
    std::vector<Message> messages;
    std::string phase;
    std::vector<std::string> trace;    // executed steps, in order
    std::vector<std::string> errors;   // recovered step failures
    std::string output;                // set on TERMINATE

    bool finished() const { return phase == phase::kTerminate; }

    const std::vector<Message>& get_messages() const { return messages; }
    // Memory context followed by the transcript, for prompts and debugging.
    std::string get_context() const;

    void append(Role role, const std::string& content,
                nlohmann::json metadata = nlohmann::json::object());
};

struct ReflectionState : StateBase {
    std::string initial_response;
    std::string current_reflection;
    std::optional<std::string> refined_response;  // set after the first REFINE
    int reflection_count = 0;
    int max_reflections = 3;

    // refined_response when any refinement happened, else initial_response
    const std::string& best_response() const;
};

struct ReActState : StateBase {
    std::string thought;
    std::optional<ToolAction> action;          // set by THINK
    std::optional<std::string> action_result;  // set by ACT, consumed by OBSERVE
    std::string action_status;
    std::optional<std::string> observation;    // set by OBSERVE
    std::optional<std::string> final_answer;
    bool finish_after_observe = false;
    int step_count = 0;
    int max_steps = 10;
    bool truncated = false;
    std::vector<std::string> tools_used;
};

struct StepRecord {
    size_t index = 0;
    std::string description;
    bool success = false;
    std::string result;   // output, or the failure reason

    nlohmann::json to_json() const;
    static StepRecord from_json(const nlohmann::json& j);
};

inline bool operator==(const StepRecord& a, const StepRecord& b) {
    return a.index == b.index && a.description == b.description &&
           a.success == b.success && a.result == b.result;
}

struct PlanningState : StateBase {
    std::string goal;
    std::vector<std::string> plan;
    size_t current_step_index = 0;
    std::map<size_t, StepRecord> completed_steps;  // keyed by plan index
    bool plan_valid = true;
    int replan_count = 0;
    int max_replans = 2;
    int max_steps = 10;
    bool truncated = false;
    std::vector<std::string> tools_used;
};

using AgentState = std::variant<ReflectionState, ReActState, PlanningState>;

Strategy state_strategy(const AgentState& state);
const StateBase& state_base(const AgentState& state);
StateBase& state_base(AgentState& state);

nlohmann::json state_to_json(const AgentState& state);
// Throws ConfigError on malformed input, UnknownStrategyError on a bad tag.
AgentState state_from_json(const nlohmann::json& j);

// Node and edge listing of a strategy's step graph.
nlohmann::json describe_graph(Strategy strategy);

} // namespace arena
