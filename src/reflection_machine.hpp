#pragma once
#include "runtime.hpp"
#include "state.hpp"
#include <string>

namespace arena {

// GENERATE_INITIAL -> REFLECT -> REFINE -> (REFLECT | TERMINATE)
class ReflectionMachine {
public:
    explicit ReflectionMachine(const RunContext& ctx) : ctx_(ctx) {}

    static ReflectionState initial_state(const std::string& input,
                                         const std::string& memory_context,
                                         int max_reflections);

    // Runs the step named by state.phase. Never throws.
    void step(ReflectionState& state);
    // Steps until TERMINATE.
    void run(ReflectionState& state);

private:
    const RunContext& ctx_;

    void generate_initial(ReflectionState& state);
    void reflect(ReflectionState& state);
    void refine(ReflectionState& state);
    void terminate(ReflectionState& state);
    void fail(ReflectionState& state, const std::string& error);
};

} // namespace arena
