#include "sqlite_logger.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

// Finalizes the statement on every path out of a scope.
struct StatementGuard {
    sqlite3_stmt* st;
    ~StatementGuard() { sqlite3_finalize(st); }
};

SessionLogger::SessionLogger(const std::string& db_path) : db_path_(db_path) {
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + db_path + ": " + msg);
    }
    // The destructor does not run if the constructor throws.
    try {
        init_schema();
    } catch (const std::exception&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SessionLogger::~SessionLogger() {
    if (db_) sqlite3_close(db_);
}

void SessionLogger::init_schema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS sessions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER,
        source TEXT NOT NULL,
        sample_rate INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS segments (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id INTEGER NOT NULL,
        start_frame INTEGER NOT NULL,
        end_frame INTEGER NOT NULL,
        start_s REAL NOT NULL,
        end_s REAL NOT NULL,
        FOREIGN KEY(session_id) REFERENCES sessions(id)
    );
    )SQL";
    exec_sql(db_, schema);
}

sqlite3_stmt* SessionLogger::prepare(const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db_));
    }
    return st;
}

std::int64_t SessionLogger::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t SessionLogger::start_session(const std::string& source, int sample_rate) {
    StatementGuard g{prepare("INSERT INTO sessions (started_ms, source, sample_rate) VALUES (?, ?, ?);")};
    sqlite3_bind_int64(g.st, 1, now_ms());
    sqlite3_bind_text(g.st, 2, source.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(g.st, 3, sample_rate);
    if (sqlite3_step(g.st) != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert session");
    }
    return sqlite3_last_insert_rowid(db_);
}

void SessionLogger::end_session(std::int64_t session_id) {
    StatementGuard g{prepare("UPDATE sessions SET ended_ms=? WHERE id=?;")};
    sqlite3_bind_int64(g.st, 1, now_ms());
    sqlite3_bind_int64(g.st, 2, session_id);
    if (sqlite3_step(g.st) != SQLITE_DONE) {
        throw std::runtime_error("Failed to close session " + std::to_string(session_id));
    }
}

void SessionLogger::log_segment(std::int64_t session_id, const sigvad::Segment& segment) {
    StatementGuard g{prepare("INSERT INTO segments (session_id, start_frame, end_frame, start_s, end_s) "
                             "VALUES (?, ?, ?, ?, ?);")};
    sqlite3_bind_int64(g.st, 1, session_id);
    sqlite3_bind_int64(g.st, 2, segment.start_frame);
    sqlite3_bind_int64(g.st, 3, segment.end_frame);
    sqlite3_bind_double(g.st, 4, segment.start_time);
    sqlite3_bind_double(g.st, 5, segment.end_time);
    if (sqlite3_step(g.st) != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert segment");
    }
}

std::vector<sigvad::Segment> SessionLogger::session_segments(std::int64_t session_id) {
    StatementGuard g{prepare("SELECT start_frame, end_frame, start_s, end_s FROM segments "
                             "WHERE session_id=? ORDER BY start_frame;")};
    sqlite3_bind_int64(g.st, 1, session_id);

    std::vector<sigvad::Segment> out;
    int rc;
    while ((rc = sqlite3_step(g.st)) == SQLITE_ROW) {
        sigvad::Segment s;
        s.start_frame = sqlite3_column_int64(g.st, 0);
        s.end_frame = sqlite3_column_int64(g.st, 1);
        s.start_time = sqlite3_column_double(g.st, 2);
        s.end_time = sqlite3_column_double(g.st, 3);
        out.push_back(s);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to read segments: ") + sqlite3_errmsg(db_));
    }
    return out;
}
