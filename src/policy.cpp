#include "policy.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>

namespace arena {

const char* verdict_name(Verdict v) {
    switch (v) {
        case Verdict::allow:   return "allow";
        case Verdict::reject:  return "reject";
        case Verdict::rewrite: return "rewrite";
    }
    return "allow";
}

// ── PolicyChain ────────────────────────────────────────────────────────

void PolicyChain::add(PolicyPtr policy) {
    if (!policy) return;
    std::lock_guard<std::mutex> lock(mutex_);
    policies_.push_back(std::move(policy));
}

std::vector<PolicyPtr> PolicyChain::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policies_;
}

ActionCheck PolicyChain::check_action(const ToolAction& action) const {
    ActionCheck check;
    check.action = action;

    for (auto& policy : snapshot()) {
        PolicyDecision decision;
        try {
            decision = policy->validate_action(check.action);
        } catch (const std::exception& e) {
            std::cerr << "[policy:" << policy->name() << "] error: " << e.what() << "\n";
            decision = PolicyDecision::reject(std::string("policy error: ") + e.what());
        }

        if (decision.verdict == Verdict::reject) {
            check.allowed = false;
            check.reason = decision.reason.empty() ? "rejected" : decision.reason;
            check.policy = policy->name();
            return check;
        }
        if (decision.verdict == Verdict::rewrite && decision.rewritten_value) {
            auto& v = *decision.rewritten_value;
            if (v.is_object()) {
                if (v.contains("name") && v["name"].is_string()) check.action.name = v["name"].get<std::string>();
                if (v.contains("args")) check.action.args = v["args"];
            }
        }
    }
    return check;
}

std::string PolicyChain::filter_response(const std::string& response) const {
    std::string out = response;
    for (auto& policy : snapshot()) {
        try {
            out = policy->filter_response(out);
        } catch (const std::exception& e) {
            std::cerr << "[policy:" << policy->name() << "] error: " << e.what() << "\n";
        }
    }
    return out;
}

std::vector<std::string> PolicyChain::names() const {
    std::vector<std::string> out;
    for (auto& p : snapshot()) out.push_back(p->name());
    return out;
}

size_t PolicyChain::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policies_.size();
}

// ── SafetyPolicy ───────────────────────────────────────────────────────

SafetyPolicy::SafetyPolicy(std::set<std::string> blocked_tools,
                           std::vector<std::string> extra_patterns)
    : blocked_tools_(std::move(blocked_tools))
    , patterns_{
        "rm -rf /", "rm -rf /*", "mkfs", "format c:", "shutdown", "reboot",
        "poweroff", "dd if=", ":(){ :|:& };:", "drop table",
        "drop database", "truncate table"
      }
{
    for (auto& p : extra_patterns) patterns_.push_back(to_lower(p));
}

PolicyDecision SafetyPolicy::validate_action(const ToolAction& action) {
    if (blocked_tools_.count(action.name)) {
        return PolicyDecision::reject("tool '" + action.name + "' is blocked by safety policy");
    }
    std::string args = to_lower(action.args.dump());
    for (auto& p : patterns_) {
        if (args.find(p) != std::string::npos) {
            return PolicyDecision::reject("potentially destructive operation ('" + p + "')");
        }
    }
    return PolicyDecision::allow();
}

// ── ContentFilterPolicy ────────────────────────────────────────────────

ContentFilterPolicy::ContentFilterPolicy(size_t max_length, std::vector<std::string> banned_words)
    : max_length_(max_length)
{
    for (auto& w : banned_words) {
        if (!w.empty()) banned_words_.push_back(to_lower(w));
    }
}

std::string ContentFilterPolicy::filter_response(const std::string& response) {
    std::string out = response;
    for (auto& word : banned_words_) {
        std::string lower = to_lower(out);
        std::string masked;
        size_t pos = 0;
        for (;;) {
            size_t hit = lower.find(word, pos);
            if (hit == std::string::npos) break;
            masked += out.substr(pos, hit - pos) + "[filtered]";
            pos = hit + word.size();
        }
        masked += out.substr(pos);
        out = std::move(masked);
    }
    if (max_length_ > 0 && out.size() > max_length_) {
        out = out.substr(0, max_length_) + "...[truncated]";
    }
    return out;
}

// ── ToolAllowlistPolicy ────────────────────────────────────────────────

PolicyDecision ToolAllowlistPolicy::validate_action(const ToolAction& action) {
    if (allowed_.count(action.name)) return PolicyDecision::allow();
    return PolicyDecision::reject("tool '" + action.name + "' is not on the allowlist");
}

// ── Construction ───────────────────────────────────────────────────────

PolicyPtr make_policy(const std::string& name, const AgentConfig& cfg) {
    if (name == "safety") return std::make_shared<SafetyPolicy>();
    if (name == "content_filter") return std::make_shared<ContentFilterPolicy>();
    if (name == "tool_allowlist") {
        return std::make_shared<ToolAllowlistPolicy>(
            std::set<std::string>(cfg.tools.begin(), cfg.tools.end()));
    }
    throw ConfigError("Unknown policy: " + name);
}

std::vector<PolicyPtr> create_default_policy_chain() {
    return {
        std::make_shared<SafetyPolicy>(),
        std::make_shared<ContentFilterPolicy>()
    };
}

} // namespace arena
