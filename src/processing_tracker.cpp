#include "uldas/processing_tracker.h"
#include <sqlite3.h>
#include <sys/stat.h>
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace uldas {

namespace {

const char* const CREATE_TABLE_SQL =
    "CREATE TABLE IF NOT EXISTS processed_files ("
    "  path TEXT PRIMARY KEY,"
    "  size INTEGER NOT NULL,"
    "  mtime REAL NOT NULL,"
    "  audio_processed INTEGER NOT NULL DEFAULT 0,"
    "  subtitle_processed INTEGER NOT NULL DEFAULT 0,"
    "  processed_date TEXT NOT NULL"
    ");";

struct FileIdentity {
    int64_t size = 0;
    double mtime = 0.0;
};

bool stat_file(const std::string& path, FileIdentity& identity) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    identity.size = static_cast<int64_t>(st.st_size);
    identity.mtime = static_cast<double>(st.st_mtime);
    return true;
}

std::string now_iso8601() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &now);
#else
    localtime_r(&now, &local_tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

/**
 * @brief Finalizes a prepared statement on scope exit
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════════════════════

class ProcessingTracker::Impl {
public:
    explicit Impl(const std::string& database_path) : path_(database_path) {
        if (database_path != ":memory:") {
            fs::path parent = fs::path(database_path).parent_path();
            std::error_code ec;
            if (!parent.empty()) fs::create_directories(parent, ec);
        }

        int rc = sqlite3_open(database_path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Failed to open tracking database " + database_path + ": " + msg);
        }

        char* err = nullptr;
        rc = sqlite3_exec(db_, CREATE_TABLE_SQL, nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Failed to initialize tracking table: " + msg);
        }
    }

    ~Impl() {
        if (db_) sqlite3_close(db_);
    }

    bool fail(const std::string& what) {
        last_error_ = what + ": " + sqlite3_errmsg(db_);
        std::cerr << "[Tracker] " << last_error_ << "\n";
        return false;
    }

    std::optional<TrackingEntry> lookup(const std::string& key) {
        Statement stmt(db_,
            "SELECT size, mtime, audio_processed, subtitle_processed, processed_date "
            "FROM processed_files WHERE path = ?;");
        if (!stmt.ok()) {
            fail("Failed to prepare lookup");
            return std::nullopt;
        }

        sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            fail("Failed to read entry");
            return std::nullopt;
        }

        TrackingEntry entry;
        entry.path = key;
        entry.size = sqlite3_column_int64(stmt.get(), 0);
        entry.mtime = sqlite3_column_double(stmt.get(), 1);
        entry.audio_processed = sqlite3_column_int(stmt.get(), 2) != 0;
        entry.subtitle_processed = sqlite3_column_int(stmt.get(), 3) != 0;
        const unsigned char* date = sqlite3_column_text(stmt.get(), 4);
        entry.processed_date = date ? reinterpret_cast<const char*>(date) : "";
        return entry;
    }

    bool upsert(const TrackingEntry& entry) {
        Statement stmt(db_,
            "INSERT INTO processed_files "
            "(path, size, mtime, audio_processed, subtitle_processed, processed_date) "
            "VALUES (?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(path) DO UPDATE SET "
            "size = excluded.size, mtime = excluded.mtime, "
            "audio_processed = excluded.audio_processed, "
            "subtitle_processed = excluded.subtitle_processed, "
            "processed_date = excluded.processed_date;");
        if (!stmt.ok()) return fail("Failed to prepare upsert");

        sqlite3_bind_text(stmt.get(), 1, entry.path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 2, entry.size);
        sqlite3_bind_double(stmt.get(), 3, entry.mtime);
        sqlite3_bind_int(stmt.get(), 4, entry.audio_processed ? 1 : 0);
        sqlite3_bind_int(stmt.get(), 5, entry.subtitle_processed ? 1 : 0);
        sqlite3_bind_text(stmt.get(), 6, entry.processed_date.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("Failed to write entry");
        return true;
    }

    bool remove(const std::string& key) {
        Statement stmt(db_, "DELETE FROM processed_files WHERE path = ?;");
        if (!stmt.ok()) return fail("Failed to prepare delete");

        sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("Failed to delete entry");
        return true;
    }

    bool remove_all() {
        char* err = nullptr;
        if (sqlite3_exec(db_, "DELETE FROM processed_files;", nullptr, nullptr, &err) != SQLITE_OK) {
            last_error_ = std::string("Failed to clear tracking table: ") + (err ? err : "unknown error");
            sqlite3_free(err);
            std::cerr << "[Tracker] " << last_error_ << "\n";
            return false;
        }
        return true;
    }

    TrackingStats stats() {
        TrackingStats result;
        Statement stmt(db_,
            "SELECT COUNT(*), "
            "SUM(CASE WHEN audio_processed = 1 AND subtitle_processed = 0 THEN 1 ELSE 0 END), "
            "SUM(CASE WHEN audio_processed = 0 AND subtitle_processed = 1 THEN 1 ELSE 0 END), "
            "SUM(CASE WHEN audio_processed = 1 AND subtitle_processed = 1 THEN 1 ELSE 0 END) "
            "FROM processed_files;");
        if (!stmt.ok()) {
            fail("Failed to prepare stats query");
            return result;
        }

        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            result.total = sqlite3_column_int(stmt.get(), 0);
            result.audio_only = sqlite3_column_int(stmt.get(), 1);
            result.subtitle_only = sqlite3_column_int(stmt.get(), 2);
            result.both = sqlite3_column_int(stmt.get(), 3);
        } else {
            fail("Failed to read stats");
        }
        return result;
    }

    sqlite3* db_ = nullptr;
    std::string path_;
    std::string last_error_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

ProcessingTracker::ProcessingTracker(const std::string& database_path)
    : pimpl_(std::make_unique<Impl>(database_path))
{
}

ProcessingTracker::~ProcessingTracker() = default;

ProcessingTracker::ProcessingTracker(ProcessingTracker&&) noexcept = default;
ProcessingTracker& ProcessingTracker::operator=(ProcessingTracker&&) noexcept = default;

std::string ProcessingTracker::make_key(const std::string& file_path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(file_path), ec);
    if (ec) return file_path;
    return absolute.lexically_normal().string();
}

bool ProcessingTracker::is_processed(const std::string& file_path) {
    std::string key = make_key(file_path);

    auto entry = pimpl_->lookup(key);
    if (!entry) {
        return false;
    }

    FileIdentity current;
    if (!stat_file(key, current)) {
        // File disappeared
        pimpl_->remove(key);
        return false;
    }

    if (entry->size != current.size || std::abs(entry->mtime - current.mtime) > 1.0) {
        pimpl_->remove(key);
        return false;
    }

    return true;
}

std::optional<TrackingEntry> ProcessingTracker::lookup(const std::string& file_path) const {
    return pimpl_->lookup(make_key(file_path));
}

bool ProcessingTracker::mark_processed(const std::string& file_path,
                                       bool audio_success,
                                       bool subtitle_success) {
    if (!audio_success && !subtitle_success) {
        return false;
    }

    TrackingEntry entry;
    entry.path = make_key(file_path);

    FileIdentity identity;
    if (!stat_file(entry.path, identity)) {
        pimpl_->last_error_ = "Cannot stat file: " + entry.path;
        std::cerr << "[Tracker] " << pimpl_->last_error_ << "\n";
        return false;
    }

    entry.size = identity.size;
    entry.mtime = identity.mtime;
    entry.audio_processed = audio_success;
    entry.subtitle_processed = subtitle_success;
    entry.processed_date = now_iso8601();

    return pimpl_->upsert(entry);
}

bool ProcessingTracker::clear_entry(const std::string& file_path) {
    return pimpl_->remove(make_key(file_path));
}

bool ProcessingTracker::clear_all() {
    return pimpl_->remove_all();
}

TrackingStats ProcessingTracker::get_stats() const {
    return pimpl_->stats();
}

std::string ProcessingTracker::get_last_error() const {
    return pimpl_->last_error_;
}

} // namespace uldas
