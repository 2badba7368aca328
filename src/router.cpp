#include "router.hpp"
#include "errors.hpp"
#include "factory.hpp"
#include "utils.hpp"
#include <set>

namespace arena {

// ── Routing ────────────────────────────────────────────────────────────

static std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : to_lower(text)) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-') {
            cur += c;
        } else if (!cur.empty()) {
            words.push_back(cur);
            cur.clear();
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

// digit, operator, digit with optional spaces between
static bool has_arithmetic(const std::string& text) {
    const std::string ops = "+-*/^%";
    for (size_t i = 0; i < text.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) continue;
        size_t j = i + 1;
        while (j < text.size() && text[j] == ' ') j++;
        if (j >= text.size() || ops.find(text[j]) == std::string::npos) continue;
        j++;
        while (j < text.size() && (text[j] == ' ' || text[j] == '*')) j++;
        if (j < text.size() && (std::isdigit(static_cast<unsigned char>(text[j])) || text[j] == '(')) {
            return true;
        }
    }
    return false;
}

Strategy AgentRouter::route(const std::string& input) {
    static const std::set<std::string> tool_words = {
        "calculate", "compute", "evaluate", "multiply", "divide", "sum",
        "time", "date", "fetch", "download", "url", "file", "files", "read",
        "write", "analyze", "analyse", "statistics", "average", "mean", "search"
    };
    static const std::set<std::string> plan_words = {
        "plan", "planning", "steps", "step-by-step", "organize", "organise",
        "schedule", "roadmap"
    };

    if (has_arithmetic(input)) return Strategy::react;
    auto words = split_words(input);
    for (auto& w : words) {
        if (tool_words.count(w)) return Strategy::react;
    }
    for (auto& w : words) {
        if (plan_words.count(w)) return Strategy::planning;
    }
    return Strategy::reflection;
}

AgentRouter::AgentRouter(std::shared_ptr<Generator> generator, AgentConfig base)
    : generator_(std::move(generator)), base_(std::move(base)) {
    if (!generator_) throw ConfigError("router requires a generator");
}

AgentPtr AgentRouter::agent_for(Strategy strategy) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = agents_.find(strategy);
    if (it != agents_.end()) return it->second;

    AgentConfig cfg = base_;
    cfg.strategy = strategy_name(strategy);
    auto agent = AgentFactory::create_agent(cfg.strategy, cfg, generator_);
    agents_[strategy] = agent;
    return agent;
}

std::string AgentRouter::process(const std::string& input) {
    Strategy s = route(input);
    AgentPtr agent;
    try {
        agent = agent_for(s);
    } catch (const std::exception& e) {
        return std::string("[error] ") + e.what();
    }
    return agent->process(input);
}

std::unique_ptr<AgentRouter> create_default_router(std::shared_ptr<Generator> generator) {
    AgentConfig base;
    base.tools = {"calculator", "time", "data_analysis"};
    base.policies = {"safety"};
    return std::make_unique<AgentRouter>(std::move(generator), base);
}

// ── Orchestration ──────────────────────────────────────────────────────

nlohmann::json WorkflowResult::to_json() const {
    nlohmann::json j;
    auto& st = j["stages"];
    st = nlohmann::json::object();
    for (auto& s : stages) st[s.key] = s.output;
    j["final_output"] = final_output;
    return j;
}

void MultiAgentOrchestrator::add_agent(const std::string& name, AgentPtr agent) {
    if (!agent) throw ConfigError("agent '" + name + "' is null");
    std::lock_guard<std::mutex> lk(mutex_);
    agents_[name] = std::move(agent);
}

bool MultiAgentOrchestrator::has_agent(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return agents_.count(name) > 0;
}

AgentPtr MultiAgentOrchestrator::agent(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = agents_.find(name);
    if (it == agents_.end()) throw NotFoundError("Unknown agent: " + name);
    return it->second;
}

void MultiAgentOrchestrator::define_workflow(const std::string& name, std::vector<std::string> agents) {
    if (agents.empty()) throw ConfigError("workflow '" + name + "' has no agents");
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& a : agents) {
        if (!agents_.count(a)) throw NotFoundError("Unknown agent: " + a);
    }
    workflows_[name] = std::move(agents);
}

std::vector<std::string> MultiAgentOrchestrator::workflows() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> out;
    for (auto& [name, steps] : workflows_) out.push_back(name);
    return out;
}

WorkflowResult MultiAgentOrchestrator::execute_workflow(const std::string& name, const std::string& input) {
    std::vector<std::pair<std::string, AgentPtr>> chain;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = workflows_.find(name);
        if (it == workflows_.end()) throw NotFoundError("Unknown workflow: " + name);
        for (auto& a : it->second) {
            auto ag = agents_.find(a);
            if (ag == agents_.end()) throw NotFoundError("Unknown agent: " + a);
            chain.emplace_back(a, ag->second);
        }
    }

    WorkflowResult result;
    std::string current = input;
    for (size_t i = 0; i < chain.size(); i++) {
        current = chain[i].second->process(current);
        result.stages.push_back({std::to_string(i) + ":" + chain[i].first, chain[i].first, current});
    }
    result.final_output = current;
    return result;
}

} // namespace arena
