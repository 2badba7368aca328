#include "episodic_memory.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <iostream>
#include <memory>
#include <set>

namespace arena {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

static StmtPtr prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db);
        std::cerr << "[episodic] prepare error: " << err << "\n";
        throw ArenaError("episodic memory: " + err);
    }
    return StmtPtr(stmt, &sqlite3_finalize);
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

static Episode read_episode(sqlite3_stmt* stmt) {
    Episode e;
    e.id = sqlite3_column_int64(stmt, 0);
    e.content = column_text(stmt, 1);
    e.outcome = column_text(stmt, 2);
    try {
        auto tools = nlohmann::json::parse(column_text(stmt, 3));
        if (tools.is_array()) e.tools_used = tools.get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[episodic] bad tools_used for episode " << e.id << ": " << ex.what() << "\n";
    }
    e.timestamp = sqlite3_column_int64(stmt, 4);
    return e;
}

nlohmann::json Episode::to_json() const {
    return {
        {"id", id},
        {"content", content},
        {"outcome", outcome},
        {"tools_used", tools_used},
        {"timestamp", timestamp}
    };
}

std::string build_fts_query(const std::string& text) {
    std::set<std::string> seen;
    std::string query;
    std::string term;
    auto flush = [&]() {
        if (!term.empty() && seen.insert(term).second) {
            if (!query.empty()) query += " OR ";
            query += "\"" + term + "\"";
        }
        term.clear();
    };
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            term += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            flush();
        }
    }
    flush();
    return query;
}

EpisodicMemory::EpisodicMemory(const std::string& db_path) {
    if (db_path != ":memory:") {
        auto parent = fs::path(db_path).parent_path();
        std::error_code ec;
        if (!parent.empty()) fs::create_directories(parent, ec);
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        std::cerr << "[episodic] Failed to open database: " << err << "\n";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw ArenaError("episodic memory: cannot open " + db_path + ": " + err);
    }

    try {
        init_tables();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

EpisodicMemory::~EpisodicMemory() {
    if (db_) sqlite3_close(db_);
}

void EpisodicMemory::exec_locked(const char* sql) const {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        if (err) sqlite3_free(err);
        std::cerr << "[episodic] exec error: " << msg << "\n";
        throw ArenaError("episodic memory: " + msg);
    }
}

void EpisodicMemory::init_tables() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec_locked(R"SQL(
        CREATE TABLE IF NOT EXISTS episodes (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            content TEXT NOT NULL,
            outcome TEXT,
            tools_used TEXT,
            timestamp INTEGER
        );

        CREATE VIRTUAL TABLE IF NOT EXISTS episodes_fts USING fts5(
            content, content='episodes', content_rowid='id'
        );

        CREATE TRIGGER IF NOT EXISTS episodes_ai AFTER INSERT ON episodes BEGIN
            INSERT INTO episodes_fts(rowid, content) VALUES (new.id, new.content);
        END;

        CREATE TRIGGER IF NOT EXISTS episodes_ad AFTER DELETE ON episodes BEGIN
            INSERT INTO episodes_fts(episodes_fts, rowid, content)
                VALUES ('delete', old.id, old.content);
        END;

        CREATE TABLE IF NOT EXISTS kv (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )SQL");
}

// ── Key/value ──────────────────────────────────────────────────────────

void EpisodicMemory::store(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)");
    std::string payload = value.dump();
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, payload.c_str(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw ArenaError(std::string("episodic memory: store failed: ") + sqlite3_errmsg(db_));
    }
}

std::optional<nlohmann::json> EpisodicMemory::retrieve(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, "SELECT value FROM kv WHERE key = ?");
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::nullopt;
    try {
        return nlohmann::json::parse(column_text(stmt.get(), 0));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[episodic] bad value for key " << key << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

void EpisodicMemory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec_locked("DELETE FROM episodes; DELETE FROM kv;");
}

// ── Episodes ───────────────────────────────────────────────────────────

int64_t EpisodicMemory::add_episode(const Episode& episode) {
    std::string tools = nlohmann::json(episode.tools_used).dump();
    int64_t ts = episode.timestamp != 0 ? episode.timestamp : epoch_now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_,
        "INSERT INTO episodes (content, outcome, tools_used, timestamp) VALUES (?, ?, ?, ?)");
    sqlite3_bind_text(stmt.get(), 1, episode.content.c_str(), static_cast<int>(episode.content.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, episode.outcome.c_str(), static_cast<int>(episode.outcome.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, tools.c_str(), static_cast<int>(tools.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 4, ts);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw ArenaError(std::string("episodic memory: insert failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_last_insert_rowid(db_);
}

Episode EpisodicMemory::get_episode(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_,
        "SELECT id, content, outcome, tools_used, timestamp FROM episodes WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw NotFoundError("Episode " + std::to_string(id) + " not found");
    }
    return read_episode(stmt.get());
}

std::vector<Episode> EpisodicMemory::recent_locked(int limit) const {
    auto stmt = prepare(db_,
        "SELECT id, content, outcome, tools_used, timestamp FROM episodes ORDER BY id DESC LIMIT ?");
    sqlite3_bind_int(stmt.get(), 1, limit);
    std::vector<Episode> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) out.push_back(read_episode(stmt.get()));
    return out;
}

std::vector<Episode> EpisodicMemory::search_episodes(const std::string& query, int limit) const {
    if (limit <= 0) return {};
    std::string fts = build_fts_query(query);

    std::lock_guard<std::mutex> lock(mutex_);
    if (fts.empty()) return recent_locked(limit);

    auto stmt = prepare(db_, R"SQL(
        SELECT e.id, e.content, e.outcome, e.tools_used, e.timestamp
        FROM episodes_fts f
        JOIN episodes e ON e.id = f.rowid
        WHERE episodes_fts MATCH ?
        ORDER BY rank, e.id DESC
        LIMIT ?
    )SQL");
    sqlite3_bind_text(stmt.get(), 1, fts.c_str(), static_cast<int>(fts.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, limit);

    std::vector<Episode> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) out.push_back(read_episode(stmt.get()));
    return out;
}

size_t EpisodicMemory::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, "SELECT COUNT(*) FROM episodes");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return 0;
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::string EpisodicMemory::get_context(const std::string& input) const {
    std::string ctx;
    for (auto& e : search_episodes(input, kContextEpisodes)) {
        ctx += "Past task: " + e.content + "\nOutcome: " + e.outcome;
        if (!e.tools_used.empty()) {
            ctx += "\nTools:";
            for (auto& t : e.tools_used) ctx += " " + t;
        }
        ctx += "\n";
    }
    return ctx;
}

void EpisodicMemory::record_interaction(const Interaction& interaction) {
    Episode e;
    e.content = interaction.input;
    e.outcome = interaction.output;
    e.tools_used = interaction.tools_used;
    add_episode(e);
}

} // namespace arena
