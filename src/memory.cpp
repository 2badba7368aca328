#include "memory.hpp"
#include "episodic_memory.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace arena {

// ── SimpleMemory ───────────────────────────────────────────────────────

void SimpleMemory::store(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

std::optional<nlohmann::json> SimpleMemory::retrieve(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

void SimpleMemory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

size_t SimpleMemory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

std::string SimpleMemory::get_context(const std::string&) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string ctx;
    for (auto& [k, v] : data_) {
        ctx += k + ": " + (v.is_string() ? v.get<std::string>() : v.dump()) + "\n";
    }
    return ctx;
}

void SimpleMemory::record_interaction(const Interaction& interaction) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_["last_input"] = interaction.input;
    data_["last_output"] = interaction.output;
}

// ── ConversationTurn ───────────────────────────────────────────────────

nlohmann::json ConversationTurn::to_json() const {
    return {
        {"user_input", user_input},
        {"agent_response", agent_response},
        {"metadata", metadata},
        {"timestamp", timestamp}
    };
}

ConversationTurn ConversationTurn::from_json(const nlohmann::json& j) {
    ConversationTurn t;
    t.user_input = j.value("user_input", "");
    t.agent_response = j.value("agent_response", "");
    if (j.contains("metadata")) t.metadata = j["metadata"];
    t.timestamp = j.value("timestamp", int64_t{0});
    return t;
}

// ── ConversationMemory ─────────────────────────────────────────────────

ConversationMemory::ConversationMemory(int max_history) : max_history_(max_history) {
    if (max_history_ < 1) throw ConfigError("max_history must be at least 1");
}

void ConversationMemory::store(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

std::optional<nlohmann::json> ConversationMemory::retrieve(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

void ConversationMemory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.clear();
    data_.clear();
}

void ConversationMemory::add_conversation_turn(const std::string& user_input,
                                               const std::string& agent_response,
                                               const nlohmann::json& metadata) {
    ConversationTurn turn;
    turn.user_input = user_input;
    turn.agent_response = agent_response;
    turn.metadata = metadata.is_null() ? nlohmann::json::object() : metadata;
    turn.timestamp = epoch_now();

    std::lock_guard<std::mutex> lock(mutex_);
    turns_.push_back(std::move(turn));
    if (static_cast<int>(turns_.size()) > max_history_) {
        turns_.pop_front();
    }
}

std::vector<ConversationTurn> ConversationMemory::get_recent_context(int n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (n <= 0) return {};
    size_t count = std::min(static_cast<size_t>(n), turns_.size());
    return std::vector<ConversationTurn>(turns_.end() - static_cast<std::ptrdiff_t>(count), turns_.end());
}

std::vector<ConversationTurn> ConversationMemory::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ConversationTurn>(turns_.begin(), turns_.end());
}

size_t ConversationMemory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

std::string ConversationMemory::get_context(const std::string&) const {
    std::string ctx;
    for (auto& turn : get_recent_context(kContextTurns)) {
        ctx += "User: " + turn.user_input + "\nAgent: " + turn.agent_response + "\n";
    }
    return ctx;
}

void ConversationMemory::record_interaction(const Interaction& interaction) {
    add_conversation_turn(interaction.input, interaction.output, {
        {"strategy", interaction.strategy},
        {"tools_used", interaction.tools_used},
        {"success", interaction.success}
    });
}

// ── Backend selection ──────────────────────────────────────────────────

MemoryPtr make_memory(const MemoryConfig& cfg) {
    if (cfg.type == "simple") return std::make_shared<SimpleMemory>();
    if (cfg.type == "conversation") return std::make_shared<ConversationMemory>(cfg.max_history);
    if (cfg.type == "episodic") return std::make_shared<EpisodicMemory>(cfg.db_path);
    throw ConfigError("Unknown memory type: " + cfg.type);
}

} // namespace arena
