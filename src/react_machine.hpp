#pragma once
#include "runtime.hpp"
#include "state.hpp"
#include <string>

namespace arena {

// THINK -> ACT -> OBSERVE -> (THINK | TERMINATE)
class ReactMachine {
public:
    explicit ReactMachine(const RunContext& ctx) : ctx_(ctx) {}

    static ReActState initial_state(const std::string& input,
                                    const std::string& memory_context,
                                    int max_steps);

    // Runs the step named by state.phase. Never throws.
    void step(ReActState& state);
    void run(ReActState& state);

    // Prompt for the next THINK: tool list, format, question and scratchpad.
    std::string build_prompt(const ReActState& state) const;

private:
    const RunContext& ctx_;

    void think(ReActState& state);
    void act(ReActState& state);
    void observe(ReActState& state);
    void truncate(ReActState& state);
    void fail(ReActState& state, const std::string& error);
};

} // namespace arena
