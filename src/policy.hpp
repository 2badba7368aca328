#pragma once
#include "tool.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena {

struct AgentConfig;

enum class Verdict { allow, reject, rewrite };

const char* verdict_name(Verdict v);

struct PolicyDecision {
    Verdict verdict = Verdict::allow;
    std::string reason;
    // For rewrite: the replacement action as {"name": ..., "args": ...}
    std::optional<nlohmann::json> rewritten_value;

    static PolicyDecision allow() { return {}; }
    static PolicyDecision reject(std::string reason) {
        return {Verdict::reject, std::move(reason), std::nullopt};
    }
    static PolicyDecision rewrite(nlohmann::json value, std::string reason = "") {
        return {Verdict::rewrite, std::move(reason), std::move(value)};
    }
};

// Gate applied to proposed tool actions and to final responses. Instances are
// shared across concurrent calls and must not keep per-call state.
class Policy {
public:
    virtual ~Policy() = default;

    virtual std::string name() const = 0;
    virtual PolicyDecision validate_action(const ToolAction& action) = 0;
    virtual std::string filter_response(const std::string& response) = 0;
};

using PolicyPtr = std::shared_ptr<Policy>;

// Result of running an action through the whole chain.
struct ActionCheck {
    bool allowed = true;
    ToolAction action;      // after any rewrites
    std::string reason;     // rejection reason
    std::string policy;     // name of the rejecting policy
};

// Ordered, append-only policy list.
class PolicyChain {
public:
    void add(PolicyPtr policy);

    // Registration order; the first reject stops the chain, rewrites replace
    // the action seen by later policies. A policy that throws rejects.
    ActionCheck check_action(const ToolAction& action) const;

    // Each policy receives the previous one's output.
    std::string filter_response(const std::string& response) const;

    std::vector<std::string> names() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<PolicyPtr> policies_;

    std::vector<PolicyPtr> snapshot() const;
};

// ── Built-in policies ──────────────────────────────────────────────────

// Blocks listed tools and destructive argument patterns.
class SafetyPolicy : public Policy {
public:
    explicit SafetyPolicy(std::set<std::string> blocked_tools = {},
                          std::vector<std::string> extra_patterns = {});

    std::string name() const override { return "safety"; }
    PolicyDecision validate_action(const ToolAction& action) override;
    std::string filter_response(const std::string& response) override { return response; }

private:
    std::set<std::string> blocked_tools_;
    std::vector<std::string> patterns_;  // lowercase
};

// Response cap used when a content filter is built by name or by default.
constexpr size_t kDefaultMaxResponseLength = 500;

// Masks banned words and caps response length. max_length 0 = no cap.
class ContentFilterPolicy : public Policy {
public:
    explicit ContentFilterPolicy(size_t max_length = kDefaultMaxResponseLength,
                                 std::vector<std::string> banned_words = {});

    std::string name() const override { return "content_filter"; }
    PolicyDecision validate_action(const ToolAction&) override { return PolicyDecision::allow(); }
    std::string filter_response(const std::string& response) override;

private:
    size_t max_length_;
    std::vector<std::string> banned_words_;
};

class ToolAllowlistPolicy : public Policy {
public:
    explicit ToolAllowlistPolicy(std::set<std::string> allowed) : allowed_(std::move(allowed)) {}

    std::string name() const override { return "tool_allowlist"; }
    PolicyDecision validate_action(const ToolAction& action) override;
    std::string filter_response(const std::string& response) override { return response; }

private:
    std::set<std::string> allowed_;
};

// safety | content_filter | tool_allowlist (allows cfg.tools). Throws ConfigError.
PolicyPtr make_policy(const std::string& name, const AgentConfig& cfg);

// Safety followed by content filtering.
std::vector<PolicyPtr> create_default_policy_chain();

} // namespace arena
