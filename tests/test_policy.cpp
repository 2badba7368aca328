#include "test_common.h"

#include "config.hpp"
#include "errors.hpp"
#include "policy.hpp"

#include <stdexcept>

using arena::ActionCheck;
using arena::PolicyChain;
using arena::PolicyDecision;
using arena::ToolAction;

// Records how often it was consulted and replies with a fixed decision.
class ScriptedPolicy : public arena::Policy {
public:
    ScriptedPolicy(std::string name, PolicyDecision decision, std::string suffix = "")
        : name_(std::move(name)), decision_(std::move(decision)), suffix_(std::move(suffix)) {}

    std::string name() const override { return name_; }
    PolicyDecision validate_action(const ToolAction& action) override {
        calls++;
        last_seen = action;
        return decision_;
    }
    std::string filter_response(const std::string& response) override {
        return response + suffix_;
    }

    int calls = 0;
    ToolAction last_seen;

private:
    std::string name_;
    PolicyDecision decision_;
    std::string suffix_;
};

class ThrowingPolicy : public arena::Policy {
public:
    std::string name() const override { return "broken"; }
    PolicyDecision validate_action(const ToolAction&) override {
        throw std::runtime_error("lookup failed");
    }
    std::string filter_response(const std::string&) override {
        throw std::runtime_error("filter failed");
    }
};

static ToolAction action(const std::string& name, nlohmann::json args = nlohmann::json::object()) {
    ToolAction a;
    a.name = name;
    a.args = std::move(args);
    return a;
}

int main() {
    // First reject stops the chain
    {
        PolicyChain chain;
        auto first = std::make_shared<ScriptedPolicy>("first", PolicyDecision::allow());
        auto blocker = std::make_shared<ScriptedPolicy>("blocker", PolicyDecision::reject("not today"));
        auto after = std::make_shared<ScriptedPolicy>("after", PolicyDecision::allow());
        chain.add(first);
        chain.add(blocker);
        chain.add(after);

        ActionCheck c = chain.check_action(action("calculator"));
        expect_true(!c.allowed, "rejected");
        expect_eq_str(c.policy, "blocker", "rejecting policy named");
        expect_eq_str(c.reason, "not today", "reason carried");
        expect_eq_ll(first->calls, 1, "earlier policy consulted");
        expect_eq_ll(after->calls, 0, "later policy skipped after reject");

        auto names = chain.names();
        expect_eq_str(names[0], "first", "registration order");
        expect_eq_str(names[2], "after", "registration order");
    }

    // Rewrites feed later policies and the final action
    {
        PolicyChain chain;
        auto rewriter = std::make_shared<ScriptedPolicy>("rewriter",
            PolicyDecision::rewrite({{"name", "calculator"}, {"args", {{"expression", "1+1"}}}}, "redirect"));
        auto observer = std::make_shared<ScriptedPolicy>("observer", PolicyDecision::allow());
        chain.add(rewriter);
        chain.add(observer);

        ActionCheck c = chain.check_action(action("shell", {{"cmd", "echo"}}));
        expect_true(c.allowed, "rewrite allows");
        expect_eq_str(c.action.name, "calculator", "rewritten name");
        expect_eq_str(c.action.args["expression"].get<std::string>(), "1+1", "rewritten args");
        expect_eq_str(observer->last_seen.name, "calculator", "later policy sees the rewrite");
    }

    // A policy that throws counts as a rejection
    {
        PolicyChain chain;
        chain.add(std::make_shared<ThrowingPolicy>());
        ActionCheck c = chain.check_action(action("time"));
        expect_true(!c.allowed, "throwing policy rejects");
        expect_true(contains(c.reason, "lookup failed"), "error in reason");
    }

    // filter_response is chained in order; a throwing filter is skipped
    {
        PolicyChain chain;
        chain.add(std::make_shared<ScriptedPolicy>("a", PolicyDecision::allow(), "-a"));
        chain.add(std::make_shared<ThrowingPolicy>());
        chain.add(std::make_shared<ScriptedPolicy>("b", PolicyDecision::allow(), "-b"));
        expect_eq_str(chain.filter_response("x"), "x-a-b", "chained filters");
    }

    // Safety
    {
        arena::SafetyPolicy safety({"filesystem"});
        expect_true(safety.validate_action(action("calculator", {{"expression", "2+2"}})).verdict
                        == arena::Verdict::allow, "harmless action allowed");
        auto d = safety.validate_action(action("shell", {{"cmd", "sudo RM -RF /"}}));
        expect_true(d.verdict == arena::Verdict::reject, "destructive pattern rejected");
        expect_true(contains(d.reason, "rm -rf /"), "pattern in reason");
        expect_true(safety.validate_action(action("db", {{"sql", "DROP TABLE users"}})).verdict
                        == arena::Verdict::reject, "drop table rejected");
        expect_true(safety.validate_action(action("filesystem", {{"operation", "read"}})).verdict
                        == arena::Verdict::reject, "blocked tool rejected");
        expect_eq_str(safety.filter_response("unchanged"), "unchanged", "safety passes responses");

        arena::SafetyPolicy custom({}, {"Secret"});
        expect_true(custom.validate_action(action("web", {{"url", "http://x/secret"}})).verdict
                        == arena::Verdict::reject, "extra pattern, case-insensitive");
    }

    // Content filter
    {
        arena::ContentFilterPolicy filter(0, {"darn"});
        expect_eq_str(filter.filter_response("Darn it, darn."), "[filtered] it, [filtered].",
                      "banned words masked case-insensitively");
        arena::ContentFilterPolicy shortener(5);
        expect_eq_str(shortener.filter_response("abcdefgh"), "abcde...[truncated]", "truncated");
        expect_eq_str(shortener.filter_response("abc"), "abc", "short text untouched");
        expect_true(filter.validate_action(action("anything")).verdict == arena::Verdict::allow,
                    "content filter allows actions");
    }

    // Allowlist and construction by name
    {
        arena::AgentConfig cfg;
        cfg.tools = {"calculator"};
        auto allow = arena::make_policy("tool_allowlist", cfg);
        expect_true(allow->validate_action(action("calculator")).verdict == arena::Verdict::allow,
                    "listed tool allowed");
        expect_true(allow->validate_action(action("web")).verdict == arena::Verdict::reject,
                    "unlisted tool rejected");

        expect_eq_str(arena::make_policy("safety", cfg)->name(), "safety", "safety by name");
        bool threw = false;
        try {
            arena::make_policy("nonsense", cfg);
        } catch (const arena::ConfigError&) {
            threw = true;
        }
        expect_true(threw, "unknown policy name rejected");

        auto defaults = arena::create_default_policy_chain();
        expect_eq_ll((long long)defaults.size(), 2, "default chain size");
        expect_eq_str(defaults[0]->name(), "safety", "safety first");
        expect_eq_str(defaults[1]->name(), "content_filter", "content filter second");

        // The default content filter caps long responses
        std::string long_text(arena::kDefaultMaxResponseLength + 100, 'x');
        std::string capped = defaults[1]->filter_response(long_text);
        expect_eq_ll((long long)capped.size(),
                     (long long)(arena::kDefaultMaxResponseLength + std::string("...[truncated]").size()),
                     "default cap applied");
        expect_true(contains(capped, "...[truncated]"), "default cap marks truncation");
        auto named = arena::make_policy("content_filter", cfg);
        expect_true(contains(named->filter_response(long_text), "...[truncated]"), "named filter caps");
        expect_eq_str(named->filter_response("short"), "short", "short response untouched");
    }

    std::cout << "test_policy OK\n";
    return 0;
}
