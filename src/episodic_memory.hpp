#pragma once
#include "memory.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace arena {

struct Episode {
    int64_t id = 0;                       // assigned by add_episode
    std::string content;
    std::string outcome;
    std::vector<std::string> tools_used;  // in call order
    int64_t timestamp = 0;                // epoch seconds, 0 = now

    nlohmann::json to_json() const;
};

inline bool operator==(const Episode& a, const Episode& b) {
    return a.id == b.id && a.content == b.content && a.outcome == b.outcome &&
           a.tools_used == b.tools_used && a.timestamp == b.timestamp;
}

// Episodes in SQLite with an FTS5 index over content. Relevance is BM25;
// a query with no searchable terms returns the newest episodes.
class EpisodicMemory : public Memory {
public:
    explicit EpisodicMemory(const std::string& db_path = ":memory:");
    ~EpisodicMemory() override;

    // Non-copyable
    EpisodicMemory(const EpisodicMemory&) = delete;
    EpisodicMemory& operator=(const EpisodicMemory&) = delete;

    std::string kind() const override { return "episodic"; }

    void store(const std::string& key, const nlohmann::json& value) override;
    std::optional<nlohmann::json> retrieve(const std::string& key) const override;
    void clear() override;

    int64_t add_episode(const Episode& episode);
    // Throws NotFoundError.
    Episode get_episode(int64_t id) const;
    std::vector<Episode> search_episodes(const std::string& query, int limit = 5) const;
    size_t count() const;

    std::string get_context(const std::string& input) const override;
    void record_interaction(const Interaction& interaction) override;

    static constexpr int kContextEpisodes = 3;

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;

    void init_tables();
    void exec_locked(const char* sql) const;
    std::vector<Episode> recent_locked(int limit) const;
};

// Quoted OR-query of the alphanumeric terms in text, "" when there are none.
std::string build_fts_query(const std::string& text);

} // namespace arena
