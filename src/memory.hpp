#pragma once
#include "config.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena {

// What the agent hands to memory after each process() call.
struct Interaction {
    std::string input;
    std::string output;
    std::string strategy;
    std::vector<std::string> tools_used;
    bool success = true;
};

// Storage for context across calls. Shared by reference between agents and
// concurrent process() calls, so every backend synchronizes internally.
class Memory {
public:
    virtual ~Memory() = default;

    virtual std::string kind() const = 0;

    virtual void store(const std::string& key, const nlohmann::json& value) = 0;
    virtual std::optional<nlohmann::json> retrieve(const std::string& key) const = 0;
    virtual void clear() = 0;

    // Text block handed to the strategy at the start of a call.
    virtual std::string get_context(const std::string& input) const = 0;
    virtual void record_interaction(const Interaction& interaction) = 0;
};

using MemoryPtr = std::shared_ptr<Memory>;

// ── Simple: unordered key/value, no TTL ────────────────────────────────

class SimpleMemory : public Memory {
public:
    std::string kind() const override { return "simple"; }

    void store(const std::string& key, const nlohmann::json& value) override;
    std::optional<nlohmann::json> retrieve(const std::string& key) const override;
    void clear() override;

    std::string get_context(const std::string& input) const override;
    void record_interaction(const Interaction& interaction) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> data_;
};

// ── Conversation: bounded FIFO of turns ────────────────────────────────

struct ConversationTurn {
    std::string user_input;
    std::string agent_response;
    nlohmann::json metadata = nlohmann::json::object();
    int64_t timestamp = 0;

    nlohmann::json to_json() const;
    static ConversationTurn from_json(const nlohmann::json& j);
};

class ConversationMemory : public Memory {
public:
    explicit ConversationMemory(int max_history = 100);

    std::string kind() const override { return "conversation"; }

    void store(const std::string& key, const nlohmann::json& value) override;
    std::optional<nlohmann::json> retrieve(const std::string& key) const override;
    void clear() override;

    // Appends a turn; beyond capacity exactly the oldest turn is evicted.
    void add_conversation_turn(const std::string& user_input,
                               const std::string& agent_response,
                               const nlohmann::json& metadata = nlohmann::json::object());

    // Last n turns, oldest first. Fewer when the history is shorter.
    std::vector<ConversationTurn> get_recent_context(int n) const;
    std::vector<ConversationTurn> history() const;
    size_t size() const;
    int max_history() const { return max_history_; }

    std::string get_context(const std::string& input) const override;
    void record_interaction(const Interaction& interaction) override;

    // Turns shown by get_context()
    static constexpr int kContextTurns = 5;

private:
    int max_history_;
    mutable std::mutex mutex_;
    std::deque<ConversationTurn> turns_;
    std::map<std::string, nlohmann::json> data_;
};

// Builds the backend named by cfg.type. Throws ConfigError.
MemoryPtr make_memory(const MemoryConfig& cfg);

} // namespace arena
