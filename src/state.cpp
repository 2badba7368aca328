#include "state.hpp"
#include "errors.hpp"

namespace arena {

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::reflection: return "reflection";
        case Strategy::react:      return "react";
        case Strategy::planning:   return "planning";
    }
    return "react";
}

Strategy parse_strategy(const std::string& name) {
    if (name == "reflection") return Strategy::reflection;
    if (name == "react")      return Strategy::react;
    if (name == "planning")   return Strategy::planning;
    throw UnknownStrategyError(name);
}

// ── StateBase ──────────────────────────────────────────────────────────

std::string StateBase::get_context() const {
    std::string ctx;
    if (!memory_context.empty()) ctx += memory_context + "\n";
    for (auto& m : messages) {
        ctx += std::string(role_name(m.role)) + ": " + m.content + "\n";
    }
    return ctx;
}

void StateBase::append(Role role, const std::string& content, nlohmann::json metadata) {
    Message m;
    m.role = role;
    m.content = content;
    m.metadata = metadata.is_object() ? std::move(metadata) : nlohmann::json::object();
    messages.push_back(std::move(m));
}

const std::string& ReflectionState::best_response() const {
    return refined_response ? *refined_response : initial_response;
}

nlohmann::json StepRecord::to_json() const {
    return {{"index", index}, {"description", description}, {"success", success}, {"result", result}};
}

StepRecord StepRecord::from_json(const nlohmann::json& j) {
    StepRecord r;
    r.index = j.value("index", size_t{0});
    r.description = j.value("description", "");
    r.success = j.value("success", false);
    r.result = j.value("result", "");
    return r;
}

// ── Variant access ─────────────────────────────────────────────────────

Strategy state_strategy(const AgentState& state) {
    switch (state.index()) {
        case 0: return Strategy::reflection;
        case 1: return Strategy::react;
        default: return Strategy::planning;
    }
}

const StateBase& state_base(const AgentState& state) {
    return std::visit([](const auto& s) -> const StateBase& { return s; }, state);
}

StateBase& state_base(AgentState& state) {
    return std::visit([](auto& s) -> StateBase& { return s; }, state);
}

// ── Serialization ──────────────────────────────────────────────────────

template <typename T>
static nlohmann::json optional_to_json(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json();
}

static void base_to_json(const StateBase& s, nlohmann::json& j) {
    j["input"] = s.input;
    j["memory_context"] = s.memory_context;
    j["messages"] = messages_to_json(s.messages);
    j["phase"] = s.phase;
    j["trace"] = s.trace;
    j["errors"] = s.errors;
    j["output"] = s.output;
}

static void base_from_json(const nlohmann::json& j, StateBase& s) {
    s.input = j.value("input", "");
    s.memory_context = j.value("memory_context", "");
    s.messages = messages_from_json(j.value("messages", nlohmann::json::array()));
    s.phase = j.value("phase", "");
    s.trace = j.value("trace", std::vector<std::string>{});
    s.errors = j.value("errors", std::vector<std::string>{});
    s.output = j.value("output", "");
}

nlohmann::json state_to_json(const AgentState& state) {
    nlohmann::json j;
    j["strategy"] = strategy_name(state_strategy(state));
    base_to_json(state_base(state), j);

    if (auto* r = std::get_if<ReflectionState>(&state)) {
        j["initial_response"] = r->initial_response;
        j["current_reflection"] = r->current_reflection;
        j["refined_response"] = optional_to_json(r->refined_response);
        j["reflection_count"] = r->reflection_count;
        j["max_reflections"] = r->max_reflections;
    } else if (auto* a = std::get_if<ReActState>(&state)) {
        j["thought"] = a->thought;
        j["action"] = a->action ? a->action->to_json() : nlohmann::json();
        j["action_result"] = optional_to_json(a->action_result);
        j["action_status"] = a->action_status;
        j["observation"] = optional_to_json(a->observation);
        j["final_answer"] = optional_to_json(a->final_answer);
        j["finish_after_observe"] = a->finish_after_observe;
        j["step_count"] = a->step_count;
        j["max_steps"] = a->max_steps;
        j["truncated"] = a->truncated;
        j["tools_used"] = a->tools_used;
    } else if (auto* p = std::get_if<PlanningState>(&state)) {
        j["goal"] = p->goal;
        j["plan"] = p->plan;
        j["current_step_index"] = p->current_step_index;
        auto& done = j["completed_steps"];
        done = nlohmann::json::array();
        for (auto& [idx, rec] : p->completed_steps) done.push_back(rec.to_json());
        j["plan_valid"] = p->plan_valid;
        j["replan_count"] = p->replan_count;
        j["max_replans"] = p->max_replans;
        j["max_steps"] = p->max_steps;
        j["truncated"] = p->truncated;
        j["tools_used"] = p->tools_used;
    }
    return j;
}

template <typename T>
static std::optional<T> optional_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

AgentState state_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("strategy")) {
        throw ConfigError("serialized state must be an object with a strategy");
    }
    Strategy strategy = parse_strategy(j.value("strategy", ""));

    try {
        switch (strategy) {
            case Strategy::reflection: {
                ReflectionState s;
                base_from_json(j, s);
                s.initial_response = j.value("initial_response", "");
                s.current_reflection = j.value("current_reflection", "");
                s.refined_response = optional_from_json<std::string>(j, "refined_response");
                s.reflection_count = j.value("reflection_count", 0);
                s.max_reflections = j.value("max_reflections", s.max_reflections);
                if (s.reflection_count < 0 || s.reflection_count > s.max_reflections) {
                    throw ConfigError("reflection_count out of range");
                }
                return s;
            }
            case Strategy::react: {
                ReActState s;
                base_from_json(j, s);
                s.thought = j.value("thought", "");
                if (j.contains("action") && j["action"].is_object()) s.action = ToolAction::from_json(j["action"]);
                s.action_result = optional_from_json<std::string>(j, "action_result");
                s.action_status = j.value("action_status", "");
                s.observation = optional_from_json<std::string>(j, "observation");
                s.final_answer = optional_from_json<std::string>(j, "final_answer");
                s.finish_after_observe = j.value("finish_after_observe", false);
                s.step_count = j.value("step_count", 0);
                s.max_steps = j.value("max_steps", s.max_steps);
                s.truncated = j.value("truncated", false);
                s.tools_used = j.value("tools_used", std::vector<std::string>{});
                if (s.step_count < 0 || s.step_count > s.max_steps) {
                    throw ConfigError("step_count out of range");
                }
                return s;
            }
            case Strategy::planning: {
                PlanningState s;
                base_from_json(j, s);
                s.goal = j.value("goal", "");
                s.plan = j.value("plan", std::vector<std::string>{});
                s.current_step_index = j.value("current_step_index", size_t{0});
                if (j.contains("completed_steps") && j["completed_steps"].is_array()) {
                    for (auto& r : j["completed_steps"]) {
                        StepRecord rec = StepRecord::from_json(r);
                        if (rec.index >= s.plan.size()) throw ConfigError("completed step outside plan");
                        s.completed_steps[rec.index] = rec;
                    }
                }
                s.plan_valid = j.value("plan_valid", true);
                s.replan_count = j.value("replan_count", 0);
                s.max_replans = j.value("max_replans", s.max_replans);
                s.max_steps = j.value("max_steps", s.max_steps);
                s.truncated = j.value("truncated", false);
                s.tools_used = j.value("tools_used", std::vector<std::string>{});
                if (s.current_step_index > s.plan.size()) throw ConfigError("current_step_index out of range");
                return s;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed state: ") + e.what());
    }
    throw UnknownStrategyError(j.value("strategy", ""));
}

// ── Graph description ──────────────────────────────────────────────────

nlohmann::json describe_graph(Strategy strategy) {
    using phase::kTerminate;
    nlohmann::json g;
    g["strategy"] = strategy_name(strategy);

    auto edge = [](const char* from, const char* to, const char* when) {
        return nlohmann::json{{"from", from}, {"to", to}, {"when", when}};
    };

    switch (strategy) {
        case Strategy::reflection:
            g["entry"] = phase::kGenerateInitial;
            g["nodes"] = {phase::kGenerateInitial, phase::kReflect, phase::kRefine, kTerminate};
            g["edges"] = {
                edge(phase::kGenerateInitial, phase::kReflect, "reflection_count < max_reflections"),
                edge(phase::kGenerateInitial, kTerminate, "max_reflections == 0 or generation failed"),
                edge(phase::kReflect, phase::kRefine, "always"),
                edge(phase::kRefine, phase::kReflect, "reflection_count < max_reflections and no stop marker"),
                edge(phase::kRefine, kTerminate, "otherwise"),
            };
            break;
        case Strategy::react:
            g["entry"] = phase::kThink;
            g["nodes"] = {phase::kThink, phase::kAct, phase::kObserve, kTerminate};
            g["edges"] = {
                edge(phase::kThink, phase::kAct, "action proposed"),
                edge(phase::kThink, kTerminate, "final answer or step limit"),
                edge(phase::kAct, phase::kObserve, "always"),
                edge(phase::kObserve, phase::kThink, "step_count < max_steps and no final answer"),
                edge(phase::kObserve, kTerminate, "otherwise"),
            };
            break;
        case Strategy::planning:
            g["entry"] = phase::kUnderstandGoal;
            g["nodes"] = {phase::kUnderstandGoal, phase::kCreatePlan, phase::kExecuteStep,
                          phase::kEvaluate, phase::kReplan, kTerminate};
            g["edges"] = {
                edge(phase::kUnderstandGoal, phase::kCreatePlan, "always"),
                edge(phase::kCreatePlan, phase::kExecuteStep, "plan not empty"),
                edge(phase::kExecuteStep, phase::kEvaluate, "always"),
                edge(phase::kEvaluate, phase::kReplan, "step failed or blocked, replans left"),
                edge(phase::kEvaluate, phase::kExecuteStep, "steps remain"),
                edge(phase::kEvaluate, kTerminate, "plan complete or step limit"),
                edge(phase::kReplan, phase::kExecuteStep, "steps remain"),
                edge(phase::kReplan, kTerminate, "no steps remain"),
            };
            break;
    }
    return g;
}

} // namespace arena
