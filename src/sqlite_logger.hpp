#pragma once
#include "sigvad/segment.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <vector>

// Session/segment logger for detection runs.
// Schema:
//  - sessions(id INTEGER PK, started_ms INTEGER, ended_ms INTEGER,
//             source TEXT, sample_rate INTEGER)
//  - segments(id INTEGER PK, session_id INTEGER, start_frame INTEGER,
//             end_frame INTEGER, start_s REAL, end_s REAL)
//
// Notes:
//  * Times use system_clock millis so sessions from different runs sort.
//  * Threading: This class is NOT thread-safe. In live capture mode segments
//    are queued by the audio callback and logged from the main thread.
class SessionLogger {
public:
    explicit SessionLogger(const std::string& db_path);
    ~SessionLogger();
    SessionLogger(const SessionLogger&) = delete;
    SessionLogger& operator=(const SessionLogger&) = delete;

    // Begins a session for `source` (file path or "mic"); returns its id.
    std::int64_t start_session(const std::string& source, int sample_rate);

    // Marks end time for a session.
    void end_session(std::int64_t session_id);

    void log_segment(std::int64_t session_id, const sigvad::Segment& segment);

    // Segments of a session in start order.
    std::vector<sigvad::Segment> session_segments(std::int64_t session_id);

    // Accessor: the path used to open the DB.
    const std::string& path() const { return db_path_; }

private:
    void init_schema();
    sqlite3_stmt* prepare(const char* sql);
    static std::int64_t now_ms();

    std::string db_path_;
    sqlite3* db_ = nullptr;
};
