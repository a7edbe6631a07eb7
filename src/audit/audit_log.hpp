#ifndef PHISCRUB_AUDIT_AUDIT_LOG_HPP
#define PHISCRUB_AUDIT_AUDIT_LOG_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <sqlite3.h>
#include <string>
#include <utility>
#include <vector>
#include "redaction/redaction_observer.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace phiscrub {
namespace audit {

/*
  AuditLog
  --------------------------------------------------------
  Append-only record of redaction activity in a SQLite file.

  Table redaction_audit:
    id                  INTEGER PRIMARY KEY AUTOINCREMENT
    timestamp           INTEGER  (unix milliseconds)
    event               TEXT     ("redact", "batch", "init", "compile_failure")
    patterns_applied    INTEGER
    processing_time_ms  REAL
    digest              TEXT     (SHA-256 of the redacted output, or rule name)

  The original text is never stored.

  Failures are reported through bool returns and the logger; nothing here
  throws into a redaction call.
*/
struct AuditEvent
{
    std::int64_t timestampMs = 0;
    std::string event;
    std::uint32_t patternsApplied = 0;
    double processingTimeMs = 0.0;
    std::string digest;
};

class AuditLog
{
public:
    explicit AuditLog(const std::string &dbFilePath)
        : m_dbFilePath(dbFilePath), m_db(nullptr)
    {
    }

    ~AuditLog() { Close(); }

    AuditLog(const AuditLog &) = delete;
    AuditLog &operator=(const AuditLog &) = delete;

    // Opens (creating if needed) the database and its schema.
    bool Open()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db) {
            return true;
        }
        if (sqlite3_open(m_dbFilePath.c_str(), &m_db) != SQLITE_OK) {
            util::logger::error("[AuditLog] Could not open database: " + m_dbFilePath +
                                " (" + sqlite3_errmsg(m_db) + ")");
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }

        const char *ddl =
            "CREATE TABLE IF NOT EXISTS redaction_audit ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "timestamp INTEGER NOT NULL,"
            "event TEXT NOT NULL,"
            "patterns_applied INTEGER NOT NULL,"
            "processing_time_ms REAL NOT NULL,"
            "digest TEXT);";
        char *errMsg = nullptr;
        if (sqlite3_exec(m_db, ddl, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            util::logger::error("[AuditLog] Failed to initialize schema: " +
                                std::string(errMsg ? errMsg : "unknown"));
            sqlite3_free(errMsg);
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        util::logger::info("[AuditLog] Recording redaction events to " + m_dbFilePath);
        return true;
    }

    void Close()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool IsOpen() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_db != nullptr;
    }

    bool Record(const AuditEvent &ev)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) {
            return false;
        }

        sqlite3_stmt *stmt = nullptr;
        const char *sql = "INSERT INTO redaction_audit "
                          "(timestamp, event, patterns_applied, processing_time_ms, digest) "
                          "VALUES (?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            util::logger::error("[AuditLog] Failed to prepare insert: " +
                                std::string(sqlite3_errmsg(m_db)));
            return false;
        }

        std::int64_t ts = ev.timestampMs != 0 ? ev.timestampMs : nowMs();
        sqlite3_bind_int64(stmt, 1, ts);
        sqlite3_bind_text(stmt, 2, ev.event.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(ev.patternsApplied));
        sqlite3_bind_double(stmt, 4, ev.processingTimeMs);
        sqlite3_bind_text(stmt, 5, ev.digest.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            util::logger::error("[AuditLog] Insert failed: " + std::string(sqlite3_errmsg(m_db)));
            return false;
        }
        return true;
    }

    // Returns the number of stored events, or -1 on error.
    int CountEvents(const std::string &event = "") const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) {
            return -1;
        }
        sqlite3_stmt *stmt = nullptr;
        const char *sql = event.empty()
            ? "SELECT COUNT(*) FROM redaction_audit"
            : "SELECT COUNT(*) FROM redaction_audit WHERE event = ?";
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return -1;
        }
        if (!event.empty()) {
            sqlite3_bind_text(stmt, 1, event.c_str(), -1, SQLITE_TRANSIENT);
        }
        int count = -1;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return count;
    }

    // Most recent events first.
    std::vector<AuditEvent> RecentEvents(int limit) const
    {
        std::vector<AuditEvent> out;
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) {
            return out;
        }
        sqlite3_stmt *stmt = nullptr;
        const char *sql = "SELECT timestamp, event, patterns_applied, processing_time_ms, digest "
                          "FROM redaction_audit ORDER BY id DESC LIMIT ?";
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return out;
        }
        sqlite3_bind_int(stmt, 1, limit);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            AuditEvent ev;
            ev.timestampMs = sqlite3_column_int64(stmt, 0);
            ev.event = columnText(stmt, 1);
            ev.patternsApplied = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 2));
            ev.processingTimeMs = sqlite3_column_double(stmt, 3);
            ev.digest = columnText(stmt, 4);
            out.push_back(ev);
        }
        sqlite3_finalize(stmt);
        return out;
    }

private:
    static std::int64_t nowMs()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    static std::string columnText(sqlite3_stmt *stmt, int col)
    {
        const unsigned char *txt = sqlite3_column_text(stmt, col);
        return txt ? std::string(reinterpret_cast<const char *>(txt)) : std::string();
    }

    std::string m_dbFilePath;
    sqlite3 *m_db;
    mutable std::mutex m_mutex;
};

/*
  AuditObserver
  --------------------------------
  Writes every observer event into an AuditLog. The log must already be open;
  if a write fails the redaction result is unaffected.
*/
class AuditObserver : public redaction::RedactionObserver
{
public:
    explicit AuditObserver(std::shared_ptr<AuditLog> log)
        : m_log(std::move(log))
    {
    }

    void onConstructed(std::size_t ruleCount) override
    {
        AuditEvent ev;
        ev.event = "init";
        ev.patternsApplied = static_cast<std::uint32_t>(ruleCount);
        write(ev);
    }

    void onCompileFailure(const std::string &ruleName, const std::string &error) override
    {
        (void)error;
        AuditEvent ev;
        ev.event = "compile_failure";
        ev.digest = ruleName;
        write(ev);
    }

    void onRedaction(const redaction::RedactionResult &result) override
    {
        AuditEvent ev;
        ev.event = "redact";
        ev.patternsApplied = result.patternsApplied;
        ev.processingTimeMs = result.processingTimeMs;
        try {
            ev.digest = util::hashing::sha256Hex(result.redactedText);
        } catch (const std::exception &ex) {
            util::logger::warn(std::string("[AuditObserver] Digest failed: ") + ex.what());
        }
        write(ev);
    }

    void onBatch(std::size_t itemCount, double elapsedMs) override
    {
        AuditEvent ev;
        ev.event = "batch";
        ev.patternsApplied = static_cast<std::uint32_t>(itemCount);
        ev.processingTimeMs = elapsedMs;
        write(ev);
    }

private:
    void write(const AuditEvent &ev)
    {
        if (!m_log || !m_log->Record(ev)) {
            util::logger::warn("[AuditObserver] Dropped audit event '" + ev.event + "'");
        }
    }

    std::shared_ptr<AuditLog> m_log;
};

} // namespace audit
} // namespace phiscrub

#endif // PHISCRUB_AUDIT_AUDIT_LOG_HPP
