#pragma once
#include "message.hpp"
#include <string>
#include <vector>

namespace arena {

// Sampling parameters forwarded with every generation request.
struct SamplingParams {
    std::string model = "gpt-4.1-mini";
    double temperature = 0.7;
    int max_tokens = 2048;
};

// The language-generation capability. Implementations must be safe to call
// from several threads at once and raise GenerationError on failure.
class Generator {
public:
    virtual ~Generator() = default;

    virtual std::string generate(const std::string& prompt,
                                 const std::vector<Message>& context,
                                 const SamplingParams& params) = 0;
};

} // namespace arena
