#include "reflection_machine.hpp"
#include "errors.hpp"
#include <iostream>

namespace arena {

ReflectionState ReflectionMachine::initial_state(const std::string& input,
                                                 const std::string& memory_context,
                                                 int max_reflections) {
    ReflectionState s;
    s.input = input;
    s.memory_context = memory_context;
    s.max_reflections = max_reflections < 0 ? 0 : max_reflections;
    s.phase = phase::kGenerateInitial;
    s.append(Role::user, input);
    return s;
}

void ReflectionMachine::run(ReflectionState& state) {
    while (!state.finished()) step(state);
}

void ReflectionMachine::step(ReflectionState& state) {
    if (state.finished()) return;
    std::string current = state.phase;
    state.trace.push_back(current);
    ctx_.log_step("reflection", current);

    try {
        if (current == phase::kGenerateInitial)  generate_initial(state);
        else if (current == phase::kReflect)     reflect(state);
        else if (current == phase::kRefine)      refine(state);
        else {
            state.trace.pop_back();
            fail(state, "unknown step: " + current);
        }
    } catch (const std::exception& e) {
        fail(state, current + " failed: " + e.what());
    }
}

// ── Steps ──────────────────────────────────────────────────────────────

void ReflectionMachine::generate_initial(ReflectionState& state) {
    std::string prompt;
    if (!state.memory_context.empty()) {
        prompt += "Context from earlier interactions:\n" + state.memory_context + "\n\n";
    }
    prompt += "Respond to the following request as well as you can.\n\n" + state.input;

    state.initial_response = ctx_.generate(prompt, state.messages);
    state.append(Role::agent, state.initial_response, {{"step", phase::kGenerateInitial}});

    if (state.reflection_count < state.max_reflections) {
        state.phase = phase::kReflect;
    } else {
        terminate(state);
    }
}

void ReflectionMachine::reflect(ReflectionState& state) {
    std::string prompt =
        "Critique the response below to the request \"" + state.input + "\".\n"
        "List concrete problems and how to fix them. If the response cannot be "
        "meaningfully improved, include the marker " + std::string(kNoFurtherImprovement) +
        ".\n\nResponse:\n" + state.best_response();

    state.current_reflection = ctx_.generate(prompt, state.messages);
    state.reflection_count++;
    state.append(Role::agent, state.current_reflection,
                 {{"step", phase::kReflect}, {"reflection", state.reflection_count}});
    state.phase = phase::kRefine;
}

void ReflectionMachine::refine(ReflectionState& state) {
    std::string prompt =
        "Rewrite the response to the request \"" + state.input + "\" so that it "
        "addresses the critique. Reply with the improved response only.\n\n"
        "Response:\n" + state.best_response() +
        "\n\nCritique:\n" + state.current_reflection;

    state.refined_response = ctx_.generate(prompt, state.messages);
    state.append(Role::agent, *state.refined_response,
                 {{"step", phase::kRefine}, {"reflection", state.reflection_count}});

    bool done = state.current_reflection.find(kNoFurtherImprovement) != std::string::npos;
    if (state.reflection_count < state.max_reflections && !done) {
        state.phase = phase::kReflect;
    } else {
        terminate(state);
    }
}

void ReflectionMachine::terminate(ReflectionState& state) {
    state.output = state.best_response();
    state.phase = phase::kTerminate;
}

// A failed generation ends the run with the most recent good response.
void ReflectionMachine::fail(ReflectionState& state, const std::string& error) {
    std::cerr << "[reflection] " << error << "\n";
    state.errors.push_back(error);
    if (state.initial_response.empty() && !state.refined_response) {
        state.output = "[error] generation failed: " + error;
        state.phase = phase::kTerminate;
        return;
    }
    terminate(state);
}

} // namespace arena
