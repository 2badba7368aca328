#pragma once

#include "errors.hpp"
#include "generator.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Replays queued responses in order. A response equal to kFail raises
// GenerationError instead; an empty queue raises as well.
class ScriptedGenerator : public arena::Generator {
public:
    static constexpr const char* kFail = "!fail";

    ScriptedGenerator() = default;
    explicit ScriptedGenerator(std::vector<std::string> responses)
        : responses_(responses.begin(), responses.end()) {}

    void push(const std::string& response) {
        std::lock_guard<std::mutex> lk(mutex_);
        responses_.push_back(response);
    }

    // Every call sleeps this long before answering.
    void set_delay(std::chrono::milliseconds d) { delay_ = d; }

    std::string generate(const std::string& prompt,
                         const std::vector<arena::Message>& context,
                         const arena::SamplingParams& params) override {
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        std::lock_guard<std::mutex> lk(mutex_);
        prompts_.push_back(prompt);
        context_sizes_.push_back(context.size());
        last_params_ = params;
        if (responses_.empty()) throw arena::GenerationError("script exhausted");
        std::string next = responses_.front();
        responses_.pop_front();
        if (next == kFail) throw arena::GenerationError("scripted failure");
        return next;
    }

    std::vector<std::string> prompts() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return prompts_;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return prompts_.size();
    }

    size_t remaining() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return responses_.size();
    }

    arena::SamplingParams last_params() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return last_params_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::string> responses_;
    std::vector<std::string> prompts_;
    std::vector<size_t> context_sizes_;
    arena::SamplingParams last_params_;
    std::chrono::milliseconds delay_{0};
};
