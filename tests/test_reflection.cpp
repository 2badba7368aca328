#include "test_common.h"
#include "scripted_generator.h"

#include "reflection_machine.hpp"
#include "runtime.hpp"
#include "state.hpp"

#include <algorithm>
#include <memory>

using arena::ReflectionMachine;
using arena::ReflectionState;
using arena::RunContext;

static long long count_steps(const ReflectionState& s, const char* name) {
    return std::count(s.trace.begin(), s.trace.end(), std::string(name));
}

static ReflectionState run(std::shared_ptr<ScriptedGenerator> gen, int max_reflections) {
    RunContext ctx;
    ctx.generator = gen;
    ReflectionState s = ReflectionMachine::initial_state("Write a haiku about rust", "", max_reflections);
    ReflectionMachine(ctx).run(s);
    return s;
}

int main() {
    using namespace arena::phase;

    // max_reflections = 0: one GENERATE_INITIAL, output is the initial response
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{"first draft"});
        ReflectionState s = run(gen, 0);
        expect_true(s.finished(), "terminated");
        expect_eq_ll(count_steps(s, kGenerateInitial), 1, "one GENERATE_INITIAL");
        expect_eq_ll(count_steps(s, kReflect), 0, "no REFLECT");
        expect_eq_ll(count_steps(s, kRefine), 0, "no REFINE");
        expect_eq_str(s.output, "first draft", "output is initial_response");
        expect_eq_str(s.output, s.initial_response, "initial_response kept");
        expect_eq_ll(s.reflection_count, 0, "no reflections");
        expect_true(!s.refined_response.has_value(), "no refinement");
        expect_eq_ll((long long)gen->calls(), 1, "one generation");
    }

    // Count bound: reflection_count reaches but never exceeds max_reflections
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "v1", "too short", "v2", "still vague", "v3", "unused"});
        ReflectionState s = run(gen, 2);
        expect_eq_ll(s.reflection_count, 2, "two reflections");
        expect_eq_ll(count_steps(s, kReflect), 2, "two REFLECT steps");
        expect_eq_ll(count_steps(s, kRefine), 2, "two REFINE steps");
        expect_eq_str(s.output, "v3", "output is the last refinement");
        expect_eq_str(s.current_reflection, "still vague", "latest critique kept");
        expect_eq_ll((long long)gen->remaining(), 1, "no generation beyond the bound");

        // Critique prompts target the most recent response
        auto prompts = gen->prompts();
        expect_true(contains(prompts[1], "v1"), "first critique sees the initial response");
        expect_true(contains(prompts[3], "v2"), "second critique sees the refinement");
        expect_true(contains(prompts[2], "too short"), "refine prompt carries the critique");

        // Transcript: user input then one agent message per generation
        expect_eq_ll((long long)s.messages.size(), 6, "append-only transcript");
        expect_true(s.messages[0].role == arena::Role::user, "input first");
    }

    // Stop marker ends the loop after the REFINE that consumes it
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "draft", "Looks good. NO_FURTHER_IMPROVEMENT", "polished draft", "unused"});
        ReflectionState s = run(gen, 5);
        expect_eq_ll(s.reflection_count, 1, "stopped after one reflection");
        expect_eq_str(s.output, "polished draft", "refined output");
        expect_eq_ll((long long)gen->calls(), 3, "three generations");
    }

    // Failure during GENERATE_INITIAL: degraded output, no throw
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{ScriptedGenerator::kFail});
        ReflectionState s = run(gen, 3);
        expect_true(s.finished(), "terminated after failure");
        expect_true(contains(s.output, "[error] generation failed"), "error explained: " + s.output);
        expect_eq_ll((long long)s.errors.size(), 1, "failure recorded");
    }

    // Failure during REFINE: best available response
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "v1", "critique", "v2", "critique again", ScriptedGenerator::kFail});
        ReflectionState s = run(gen, 3);
        expect_eq_str(s.output, "v2", "most recent good response");
        expect_eq_ll(s.reflection_count, 2, "count reflects completed REFLECT steps");
        expect_true(s.reflection_count <= s.max_reflections, "bound holds");
    }

    // Failure during REFLECT before any refinement: initial response
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "only draft", ScriptedGenerator::kFail});
        ReflectionState s = run(gen, 3);
        expect_eq_str(s.output, "only draft", "initial response survives");
        expect_eq_ll(s.reflection_count, 0, "failed REFLECT does not count");
    }

    // Step-wise execution and serialization mid-run
    {
        auto gen = std::make_shared<ScriptedGenerator>(std::vector<std::string>{
            "a", "b NO_FURTHER_IMPROVEMENT", "c"});
        RunContext ctx;
        ctx.generator = gen;
        ReflectionMachine machine(ctx);
        ReflectionState s = ReflectionMachine::initial_state("task", "", 2);
        machine.step(s);
        expect_eq_str(s.phase, kReflect, "next step is REFLECT");

        arena::AgentState snapshot = s;
        arena::AgentState restored = arena::state_from_json(arena::state_to_json(snapshot));
        auto& r = std::get<ReflectionState>(restored);
        expect_eq_str(r.initial_response, "a", "initial response serialized");
        expect_eq_str(r.phase, kReflect, "phase serialized");

        machine.run(r);
        expect_eq_str(r.output, "c", "resumed run completes");
    }

    std::cout << "test_reflection OK\n";
    return 0;
}
