#include "test_common.h"
#include "scripted_generator.h"

#include "planning_machine.hpp"
#include "runtime.hpp"
#include "tools/builtin_tools.hpp"

#include <algorithm>
#include <memory>

using arena::PlanningMachine;
using arena::PlanningState;
using arena::RunContext;
using arena::StepRecord;

static long long count_steps(const PlanningState& s, const char* name) {
    return std::count(s.trace.begin(), s.trace.end(), std::string(name));
}

static void expect_indices_in_plan(const PlanningState& s, const std::string& when) {
    for (auto& [idx, rec] : s.completed_steps) {
        expect_true(idx < s.plan.size(), "completed step outside plan " + when);
        expect_eq_ll((long long)rec.index, (long long)idx, "record index matches key " + when);
    }
    expect_true(s.current_step_index <= s.plan.size(), "current_step_index in range " + when);
}

int main() {
    using namespace arena::phase;

    // Plan parsing
    {
        auto steps = arena::parse_plan("Here is the plan:\n1. design\n2) implement\n- test\n");
        expect_eq_ll((long long)steps.size(), 3, "numbered and bulleted steps");
        expect_eq_str(steps[1], "implement", "numbering stripped");
        auto plain = arena::parse_plan("first\n\nsecond");
        expect_eq_ll((long long)plain.size(), 2, "plain lines fallback");
    }

    // Scenario: "implement" fails -> EVALUATE -> REPLAN, completed records untouched
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "1. design\n2. implement\n3. test",
            "Final Answer: designed the interface",
            ScriptedGenerator::kFail,
            "1. implement again with smaller pieces\n2. test",
            "Final Answer: implemented",
            "Final Answer: tests pass"});
        RunContext ctx;
        ctx.generator = gen;
        PlanningMachine machine(ctx);
        PlanningState s = PlanningMachine::initial_state("write and test a function", "", 10, 2);

        StepRecord design_record;
        StepRecord implement_record;
        while (!s.finished()) {
            std::string next = s.phase;
            machine.step(s);
            expect_indices_in_plan(s, "after " + next);

            if (next == kEvaluate && s.completed_steps.count(1) && implement_record.description.empty()) {
                design_record = s.completed_steps.at(0);
                implement_record = s.completed_steps.at(1);
                expect_true(!s.plan_valid, "failed step invalidates the plan");
                expect_eq_str(s.phase, kReplan, "EVALUATE moves to REPLAN");
            }
            if (next == kReplan) {
                expect_true(s.completed_steps.at(0) == design_record, "replan keeps step 0");
                expect_true(s.completed_steps.at(1) == implement_record, "replan keeps step 1");
            }
        }

        expect_eq_str(s.goal, "write and test a function", "goal from input");
        expect_true(design_record.success, "design succeeded");
        expect_eq_str(design_record.result, "designed the interface", "design result");
        expect_true(!implement_record.success, "implement failed");
        expect_true(contains(implement_record.result, "scripted failure"), "failure reason recorded");
        expect_eq_ll(count_steps(s, kReplan), 1, "one REPLAN");
        expect_eq_ll(s.replan_count, 1, "replan counted");

        expect_eq_ll((long long)s.plan.size(), 4, "completed prefix plus new steps");
        expect_eq_str(s.plan[0], "design", "executed step kept");
        expect_eq_str(s.plan[1], "implement", "failed step kept");
        expect_eq_str(s.plan[2], "implement again with smaller pieces", "new step appended");
        expect_eq_ll((long long)s.completed_steps.size(), 4, "every step executed");
        expect_true(s.completed_steps.at(0) == design_record, "final state keeps step 0");
        expect_true(s.completed_steps.at(1) == implement_record, "final state keeps step 1");

        expect_true(contains(s.output, "Goal: write and test a function"), "summary has goal");
        expect_true(contains(s.output, "[ok] 1. design: designed the interface"), "summary step 1");
        expect_true(contains(s.output, "[failed] 2. implement"), "summary step 2");
        expect_true(contains(s.output, "[ok] 4. test: tests pass"), "summary last step");
    }

    // PLAN_BLOCKED marks the plan invalid; without replans left the plan continues
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "1. fetch data\n2. report",
            "Final Answer: PLAN_BLOCKED the server is down",
            "Final Answer: reported the outage"});
        RunContext ctx;
        ctx.generator = gen;
        PlanningState s = PlanningMachine::initial_state("daily report", "", 10, 0);
        PlanningMachine(ctx).run(s);
        expect_eq_ll(count_steps(s, kReplan), 0, "no replans allowed");
        expect_eq_ll((long long)s.completed_steps.size(), 2, "partial failure tolerated");
        expect_true(contains(s.output, "reported the outage"), "later step ran");
    }

    // Steps may use tools through the policy-gated path
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "1. add the numbers",
            "Action: calculator\nAction Input: {\"expression\": \"19 + 23\"}"});
        RunContext ctx;
        ctx.generator = gen;
        ctx.tools = std::make_shared<arena::ToolRegistry>();
        ctx.tools->register_tool(arena::make_calculator_tool());
        ctx.policies = std::make_shared<arena::PolicyChain>();
        ctx.policies->add(std::make_shared<arena::SafetyPolicy>());

        PlanningState s = PlanningMachine::initial_state("sum", "", 10, 1);
        PlanningMachine(ctx).run(s);
        expect_eq_str(s.completed_steps.at(0).result, "42", "tool result is the step result");
        expect_eq_str(s.tools_used[0], "calculator", "tool recorded");
        expect_true(contains(gen->prompts()[1], "calculator"), "step prompt lists tools");
    }

    // Plan generation failure falls back to a single step
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            ScriptedGenerator::kFail, "Final Answer: did it directly"});
        RunContext ctx;
        ctx.generator = gen;
        PlanningState s = PlanningMachine::initial_state("tidy the desk", "", 10, 1);
        PlanningMachine(ctx).run(s);
        expect_eq_ll((long long)s.plan.size(), 1, "single-step plan");
        expect_eq_str(s.plan[0], "tidy the desk", "goal is the step");
        expect_eq_ll((long long)s.errors.size(), 1, "failure recorded");
        expect_true(contains(s.output, "did it directly"), "plan still executed");
    }

    // max_steps caps executed steps
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "1. a\n2. b\n3. c\n4. d", "Final Answer: A", "Final Answer: B", "Final Answer: C"});
        RunContext ctx;
        ctx.generator = gen;
        PlanningState s = PlanningMachine::initial_state("letters", "", 2, 0);
        PlanningMachine(ctx).run(s);
        expect_eq_ll((long long)s.completed_steps.size(), 2, "two steps executed");
        expect_true(s.truncated, "truncated");
        expect_true(contains(s.output, "[step limit reached after 2 steps]"), "truncation noted");
        expect_indices_in_plan(s, "after truncation");
    }

    std::cout << "test_planning OK\n";
    return 0;
}
