#include "runtime.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>

namespace arena {

std::string RunContext::generate(const std::string& prompt, const std::vector<Message>& context) const {
    if (!generator) throw GenerationError("no generator configured");
    auto gen = generator;
    auto params = sampling;
    std::vector<Message> ctx_copy = context;
    try {
        return run_with_deadline([gen, prompt, ctx_copy, params]() {
            return gen->generate(prompt, ctx_copy, params);
        }, generation_timeout, cancel, "generation");
    } catch (const ArenaError&) {
        throw;
    } catch (const std::exception& e) {
        throw GenerationError(e.what());
    }
}

void RunContext::log_step(const char* strategy, const std::string& step, const std::string& detail) const {
    if (!verbose) return;
    std::cerr << "[" << strategy << "] " << step;
    if (!detail.empty()) std::cerr << ": " << detail;
    std::cerr << "\n";
}

const char* action_status_name(ActionStatus s) {
    switch (s) {
        case ActionStatus::ok:        return "ok";
        case ActionStatus::rejected:  return "rejected";
        case ActionStatus::not_found: return "not_found";
        case ActionStatus::failed:    return "failed";
        case ActionStatus::timeout:   return "timeout";
        case ActionStatus::cancelled: return "cancelled";
    }
    return "failed";
}

// ── Tool invocation ────────────────────────────────────────────────────

ActionOutcome invoke_action(const RunContext& ctx, const ToolAction& action) {
    ActionOutcome out;
    out.action = action;

    if (ctx.policies) {
        ActionCheck check = ctx.policies->check_action(action);
        if (!check.allowed) {
            out.status = ActionStatus::rejected;
            out.text = "Action rejected by policy '" + check.policy + "': " + check.reason;
            return out;
        }
        out.action = check.action;
    }

    ToolPtr tool;
    try {
        if (!ctx.tools) throw ToolNotFoundError(out.action.name);
        tool = ctx.tools->get(out.action.name);
    } catch (const ToolNotFoundError& e) {
        out.status = ActionStatus::not_found;
        out.text = std::string("Error: ") + e.what();
        return out;
    } catch (const ArenaError& e) {
        out.status = ActionStatus::failed;
        out.text = std::string("Error: ") + e.what();
        return out;
    }

    nlohmann::json args = out.action.args;
    out.invoked = true;
    try {
        out.text = run_with_deadline([tool, args]() { return tool->execute(args); },
                                     ctx.tool_timeout, ctx.cancel,
                                     "tool '" + out.action.name + "'");
    } catch (const TimeoutError& e) {
        out.status = ActionStatus::timeout;
        out.text = std::string("Error: ") + e.what();
    } catch (const CancelledError& e) {
        out.status = ActionStatus::cancelled;
        out.text = std::string("Error: ") + e.what();
    } catch (const std::exception& e) {
        out.status = ActionStatus::failed;
        out.text = std::string("Error: ") + e.what();
    }
    return out;
}

// ── Output parsing ─────────────────────────────────────────────────────

namespace {

enum class Field { none, thought, action, action_input, final_answer };

bool match_key(const std::string& line, const char* key, std::string& rest) {
    std::string lower = to_lower(line);
    std::string k = to_lower(key);
    if (!starts_with(lower, k)) return false;
    rest = trim(line.substr(k.size()));
    return true;
}

std::string strip_code_fence(const std::string& text) {
    std::string t = trim(text);
    if (starts_with(t, "```")) {
        size_t nl = t.find('\n');
        t = (nl == std::string::npos) ? "" : t.substr(nl + 1);
        size_t end = t.rfind("```");
        if (end != std::string::npos) t = t.substr(0, end);
    }
    return trim(t);
}

nlohmann::json parse_action_input(const std::string& raw) {
    std::string text = strip_code_fence(raw);
    if (text.empty()) return nlohmann::json::object();
    try {
        auto j = nlohmann::json::parse(text);
        if (j.is_object()) return j;
        return {{"input", j.is_string() ? j.get<std::string>() : j.dump()}};
    } catch (const nlohmann::json::parse_error&) {
        return {{"input", text}};
    }
}

void append_line(std::string& field, const std::string& line) {
    if (!field.empty()) field += "\n";
    field += line;
}

} // namespace

ParsedOutput parse_agent_output(const std::string& text) {
    ParsedOutput out;
    std::string thought, action_name, action_input, final_answer;
    bool saw_key = false, saw_final = false;
    Field current = Field::none;

    for (auto& raw_line : split_lines(text)) {
        std::string line = trim(raw_line);
        std::string rest;
        if (match_key(line, "Thought:", rest)) {
            current = Field::thought; saw_key = true;
            append_line(thought, rest);
        } else if (match_key(line, "Action Input:", rest)) {
            current = Field::action_input; saw_key = true;
            append_line(action_input, rest);
        } else if (match_key(line, "Action:", rest)) {
            current = Field::action; saw_key = true;
            action_name = rest;
        } else if (match_key(line, "Final Answer:", rest)) {
            current = Field::final_answer; saw_key = true; saw_final = true;
            append_line(final_answer, rest);
        } else {
            switch (current) {
                case Field::thought:      append_line(thought, raw_line); break;
                case Field::action_input: append_line(action_input, raw_line); break;
                case Field::final_answer: append_line(final_answer, raw_line); break;
                case Field::action:
                case Field::none:
                    break;
            }
        }
    }

    if (!saw_key) {
        out.thought = trim(text);
        out.final_answer = trim(text);
        return out;
    }

    out.thought = trim(thought);
    if (!trim(action_name).empty()) {
        ToolAction a;
        a.name = trim(action_name);
        a.args = parse_action_input(action_input);
        out.action = std::move(a);
    }
    if (saw_final) {
        out.final_answer = trim(final_answer);
    } else if (!out.action) {
        // Neither an action nor an explicit answer: the text is the answer
        out.final_answer = out.thought.empty() ? trim(text) : out.thought;
    }
    return out;
}

std::vector<std::string> parse_plan(const std::string& text) {
    std::vector<std::string> numbered, plain;
    for (auto& raw : split_lines(text)) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        size_t i = 0;
        while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]))) i++;
        if (i > 0 && i < line.size() && (line[i] == '.' || line[i] == ')')) {
            std::string step = trim(line.substr(i + 1));
            if (!step.empty()) numbered.push_back(step);
            continue;
        }
        if ((line[0] == '-' || line[0] == '*') && line.size() > 1) {
            std::string step = trim(line.substr(1));
            if (!step.empty()) numbered.push_back(step);
            continue;
        }
        plain.push_back(line);
    }
    return numbered.empty() ? plain : numbered;
}

} // namespace arena
