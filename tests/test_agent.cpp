#include "test_common.h"
#include "scripted_generator.h"

#include "agent.hpp"
#include "errors.hpp"
#include "factory.hpp"
#include "planning_machine.hpp"
#include "router.hpp"
#include "tools/builtin_tools.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <thread>

using arena::AgentBuilder;
using arena::AgentFactory;

static std::shared_ptr<ScriptedGenerator> script(std::vector<std::string> responses) {
    return std::make_shared<ScriptedGenerator>(std::move(responses));
}

int main() {
    // Factory resolves strategy names
    {
        arena::AgentConfig cfg;
        for (auto& name : AgentFactory::strategies()) {
            auto agent = AgentFactory::create_agent(name, cfg, script({}));
            expect_eq_str(arena::strategy_name(agent->strategy()), name, "strategy " + name);
        }

        bool threw = false;
        try {
            AgentFactory::create_agent("chain_of_thought", cfg, script({}));
        } catch (const arena::UnknownStrategyError& e) {
            threw = contains(e.what(), "chain_of_thought");
        }
        expect_true(threw, "unknown strategy rejected");

        cfg.tools = {"calculator", "time"};
        cfg.policies = {"safety"};
        auto agent = AgentFactory::create_agent("react", cfg, script({}));
        expect_eq_ll((long long)agent->tools().size(), 2, "named tools wired");
        expect_eq_str(agent->tools().list()[0], "calculator", "tool order kept");
        expect_eq_str(agent->policies().names()[0], "safety", "named policy wired");

        cfg.tools = {"warp_drive"};
        threw = false;
        try {
            AgentFactory::create_agent("react", cfg, script({}));
        } catch (const arena::ToolNotFoundError&) {
            threw = true;
        }
        expect_true(threw, "unknown tool name surfaces at construction");

        auto from_json = AgentFactory::create_agent(
            nlohmann::json{{"strategy", "planning"}, {"max_replans", 1}}, script({}));
        expect_true(from_json->strategy() == arena::Strategy::planning, "strategy from JSON config");
        expect_eq_ll(from_json->config().max_replans, 1, "bounds from JSON config");
    }

    // Builder wires everything at build()
    {
        auto gen = script({"Final Answer: ok"});
        auto agent = AgentBuilder("react")
            .with_memory("simple")
            .with_tool(arena::make_calculator_tool())
            .with_tool("time")
            .with_policy("safety")
            .with_policy(std::make_shared<arena::ContentFilterPolicy>(0, std::vector<std::string>{"ok"}))
            .with_max_steps(4)
            .with_temperature(0.1)
            .with_model("local-model")
            .with_max_tokens(256)
            .with_generator(gen)
            .build();

        expect_eq_ll(agent->config().max_steps, 4, "max_steps");
        expect_eq_str(agent->memory()->kind(), "simple", "memory choice");
        auto names = agent->tools().list();
        expect_eq_ll((long long)names.size(), 2, "instance and named tools");
        expect_eq_str(names[0], "calculator", "instance tools first");
        expect_eq_ll((long long)agent->policies().size(), 2, "two policies");

        std::string out = agent->process("hi");
        expect_eq_str(out, "[filtered]", "final response filtered");
        expect_eq_str(gen->last_params().model, "local-model", "model forwarded");
        expect_eq_ll(gen->last_params().max_tokens, 256, "max_tokens forwarded");

        bool threw = false;
        try {
            AgentBuilder("telepathy").with_generator(gen).build();
        } catch (const arena::UnknownStrategyError&) {
            threw = true;
        }
        expect_true(threw, "builder validates strategy");

        threw = false;
        try {
            AgentBuilder("react").with_generator(gen).with_max_reflections(-1).build();
        } catch (const arena::ConfigError&) {
            threw = true;
        }
        expect_true(threw, "builder validates bounds");

        threw = false;
        try {
            AgentBuilder("react").with_generator(gen).with_memory("holographic").build();
        } catch (const arena::ConfigError&) {
            threw = true;
        }
        expect_true(threw, "builder validates memory type");

        auto patched = AgentBuilder()
            .with_config({{"strategy", "reflection"}, {"max_reflections", 1}})
            .with_generator(gen)
            .build();
        expect_true(patched->strategy() == arena::Strategy::reflection, "strategy from patch");
        expect_eq_ll(patched->config().max_reflections, 1, "bound from patch");

        auto tool = arena::make_calculator_tool();
        threw = false;
        try {
            agent->add_tool(tool);
        } catch (const arena::DuplicateToolError&) {
            threw = true;
        }
        expect_true(threw, "duplicate tool on an agent");
    }

    // Idempotence: identical input on cleared memory gives independent runs
    {
        auto gen = script({"answer A", "answer A"});
        auto agent = AgentBuilder("reflection").with_max_reflections(0).with_generator(gen).build();

        std::string first = agent->process("same question");
        nlohmann::json s1 = agent->get_state();
        agent->memory()->clear();
        std::string second = agent->process("same question");
        nlohmann::json s2 = agent->get_state();

        expect_eq_str(first, second, "same output");
        expect_true(s1 == s2, "identical states, nothing leaked from the first run");
        expect_eq_ll((long long)s2["messages"].size(), 2, "fresh transcript");
        expect_eq_str(s2["memory_context"].get<std::string>(), "", "no context after clear");
    }

    // Memory threads context between calls
    {
        auto gen = script({"Paris", "It is in France"});
        auto agent = AgentBuilder("reflection").with_max_reflections(0)
            .with_memory("conversation", 10).with_generator(gen).build();
        agent->process("capital of France?");
        agent->process("where is it?");
        auto prompts = gen->prompts();
        expect_true(contains(prompts[1], "Paris"), "second call sees the first turn");
        auto conv = std::dynamic_pointer_cast<arena::ConversationMemory>(agent->memory());
        expect_true(conv != nullptr, "conversation backend");
        expect_eq_ll((long long)conv->size(), 2, "one turn per call");
    }

    // get_state / resume across a restart
    {
        auto gen = script({"1. outline\n2. draft", "Final Answer: outlined"});
        auto agent = AgentBuilder("planning").with_generator(gen).build();
        expect_true(agent->get_state().is_null(), "no state before the first run");

        // Simulate a run interrupted after the first step by stepping a machine
        arena::RunContext ctx;
        ctx.generator = gen;
        arena::PlanningMachine machine(ctx);
        arena::PlanningState s = arena::PlanningMachine::initial_state("write an essay", "", 10, 2);
        while (s.phase != arena::phase::kExecuteStep || s.completed_steps.empty()) machine.step(s);
        nlohmann::json saved = arena::state_to_json(s);
        expect_eq_str(saved["phase"].get<std::string>(), arena::phase::kExecuteStep, "saved mid-plan");

        gen->push("Final Answer: drafted");
        auto restarted = AgentBuilder("planning").with_generator(gen).build();
        std::string out = restarted->resume(saved);
        expect_true(contains(out, "[ok] 1. outline: outlined"), "earlier step kept: " + out);
        expect_true(contains(out, "[ok] 2. draft: drafted"), "remaining step executed");

        bool threw = false;
        try {
            AgentBuilder("react").with_generator(gen).build()->resume(saved);
        } catch (const arena::ConfigError&) {
            threw = true;
        }
        expect_true(threw, "strategy mismatch rejected");

        threw = false;
        try {
            restarted->resume(nlohmann::json{{"strategy", "planning"}, {"plan", {"a"}},
                                             {"current_step_index", 5}});
        } catch (const arena::ConfigError&) {
            threw = true;
        }
        expect_true(threw, "out-of-range state rejected");
    }

    // Compiled graph
    {
        auto agent = AgentBuilder("react").with_generator(script({})).build();
        auto g = agent->get_compiled_graph();
        expect_eq_str(g["strategy"].get<std::string>(), "react", "graph strategy");
        expect_eq_str(g["entry"].get<std::string>(), "THINK", "entry node");
        expect_eq_ll((long long)g["nodes"].size(), 4, "react nodes");
        bool observe_to_think = false;
        for (auto& e : g["edges"]) {
            if (e["from"] == "OBSERVE" && e["to"] == "THINK") observe_to_think = true;
        }
        expect_true(observe_to_think, "loop edge present");
        expect_eq_ll((long long)arena::describe_graph(arena::Strategy::planning)["nodes"].size(), 6,
                     "planning nodes");
    }

    // Presets
    {
        arena::AgentPresets presets;
        expect_true(presets.has("basic_reflection"), "basic_reflection");
        expect_true(presets.has("tool_react"), "tool_react");
        expect_true(presets.has("deep_planner"), "deep_planner");

        auto react = presets.create_from_preset("tool_react", script({}));
        expect_true(react->strategy() == arena::Strategy::react, "preset strategy");
        expect_true(react->tools().has("calculator"), "preset tools");

        bool threw = false;
        try {
            presets.create_from_preset("nope", script({}));
        } catch (const arena::NotFoundError&) {
            threw = true;
        }
        expect_true(threw, "unknown preset");

        arena::AgentConfig custom;
        custom.strategy = "reflection";
        presets.register_preset("mine", custom);
        expect_true(presets.get("mine").strategy == "reflection", "custom preset");
    }

    // Router
    {
        expect_true(arena::AgentRouter::route("Calculate 2 + 2") == arena::Strategy::react, "arithmetic");
        expect_true(arena::AgentRouter::route("what is 17*3") == arena::Strategy::react, "inline arithmetic");
        expect_true(arena::AgentRouter::route("read the file notes.txt") == arena::Strategy::react, "tool verb");
        expect_true(arena::AgentRouter::route("Plan a product launch") == arena::Strategy::planning, "plan");
        expect_true(arena::AgentRouter::route("organize my week") == arena::Strategy::planning, "organize");
        expect_true(arena::AgentRouter::route("explain monads") == arena::Strategy::reflection, "default");

        auto gen = script({"Final Answer: 4", "an essay"});
        auto router = arena::create_default_router(gen);
        expect_eq_str(router->process("Calculate 2 + 2"), "4", "routed to react");
        auto react = router->agent_for(arena::Strategy::react);
        expect_true(react == router->agent_for(arena::Strategy::react), "agent cached");
        expect_true(react->tools().has("calculator"), "default router tools");
    }

    // Orchestrator
    {
        auto gen = script({"draft text", "Final Answer: reviewed draft text"});
        arena::MultiAgentOrchestrator orch;
        orch.add_agent("writer", AgentBuilder("reflection").with_max_reflections(0).with_generator(gen).build());
        orch.add_agent("reviewer", AgentBuilder("react").with_generator(gen).build());
        orch.define_workflow("publish", {"writer", "reviewer"});

        auto result = orch.execute_workflow("publish", "write about tea");
        expect_eq_ll((long long)result.stages.size(), 2, "two stages");
        expect_eq_str(result.stages[0].key, "0:writer", "stage key");
        expect_eq_str(result.stages[0].output, "draft text", "writer output");
        expect_eq_str(result.final_output, "reviewed draft text", "reviewer output is final");
        expect_true(contains(gen->prompts()[1], "draft text"), "reviewer received writer output");
        expect_eq_str(result.to_json()["stages"]["1:reviewer"].get<std::string>(),
                      "reviewed draft text", "keyed JSON");

        bool threw = false;
        try {
            orch.execute_workflow("missing", "x");
        } catch (const arena::NotFoundError&) {
            threw = true;
        }
        expect_true(threw, "unknown workflow");

        threw = false;
        try {
            orch.define_workflow("bad", {"writer", "ghost"});
        } catch (const arena::NotFoundError&) {
            threw = true;
        }
        expect_true(threw, "unknown agent in workflow");
    }

    // Concurrent process() calls on one agent share its memory
    {
        const int kThreads = 8;
        const int kCallsEach = 5;
        auto gen = script(std::vector<std::string>(kThreads * kCallsEach, "Final Answer: done"));
        auto memory = std::make_shared<arena::ConversationMemory>(100);
        auto agent = std::make_shared<arena::Agent>(arena::Strategy::react, arena::AgentConfig{}, gen, memory);

        std::atomic<int> good{0};
        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; t++) {
            workers.emplace_back([agent, &good, t, kCallsEach]() {
                for (int i = 0; i < kCallsEach; i++) {
                    std::string q = "question " + std::to_string(t) + "-" + std::to_string(i);
                    if (agent->process(q) == "done") good++;
                }
            });
        }
        for (auto& w : workers) w.join();

        expect_eq_ll(good.load(), kThreads * kCallsEach, "every concurrent call answered");
        expect_eq_ll((long long)gen->calls(), kThreads * kCallsEach, "one generation per call");
        expect_eq_ll((long long)memory->size(), kThreads * kCallsEach, "every turn recorded");

        std::set<std::string> inputs;
        for (auto& turn : memory->history()) {
            inputs.insert(turn.user_input);
            expect_eq_str(turn.agent_response, "done", "recorded response");
        }
        expect_eq_ll((long long)inputs.size(), kThreads * kCallsEach, "no turn lost or duplicated");
        expect_true(!agent->get_state().is_null(), "state kept after concurrent runs");
    }

    std::cout << "test_agent OK\n";
    return 0;
}
