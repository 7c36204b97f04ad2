#pragma once

#include "export.h"
#include "types.h"
#include <memory>
#include <optional>
#include <string>

namespace uldas {

/**
 * @brief Content-identity cache of files with confirmed verdicts
 *
 * Entries are keyed by absolute path and stay valid only while the file's
 * size and modification time (1 second tolerance) match the recorded
 * values. Backed by a SQLite table; single writer.
 *
 * Example:
 * @code
 *   uldas::ProcessingTracker tracker("config/processed_files.db");
 *   if (!tracker.is_processed(path)) {
 *       // ... classify ...
 *       tracker.mark_processed(path, audio_ok, subtitle_ok);
 *   }
 * @endcode
 */
class ULDAS_API ProcessingTracker {
public:
    /**
     * @brief Open (or create) the tracking database
     * @param database_path SQLite file (":memory:" for an in-memory table)
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit ProcessingTracker(const std::string& database_path);

    ~ProcessingTracker();

    // Move-only
    ProcessingTracker(ProcessingTracker&&) noexcept;
    ProcessingTracker& operator=(ProcessingTracker&&) noexcept;
    ProcessingTracker(const ProcessingTracker&) = delete;
    ProcessingTracker& operator=(const ProcessingTracker&) = delete;

    /**
     * @brief Whether the file has a valid entry
     *
     * A stale entry (file missing, size or mtime changed) is deleted.
     */
    bool is_processed(const std::string& file_path);

    /**
     * @brief Read the entry for a file without validating it
     */
    std::optional<TrackingEntry> lookup(const std::string& file_path) const;

    /**
     * @brief Insert or replace the entry for a file
     *
     * Nothing is written unless at least one flag is true.
     *
     * @return True if an entry was written
     */
    bool mark_processed(const std::string& file_path, bool audio_success, bool subtitle_success);

    /**
     * @brief Remove the entry for a file
     */
    bool clear_entry(const std::string& file_path);

    /**
     * @brief Remove every entry
     */
    bool clear_all();

    /**
     * @brief Count entries by success flags
     */
    TrackingStats get_stats() const;

    /**
     * @brief Get last error message
     */
    std::string get_last_error() const;

    /**
     * @brief Absolute, normalized key for a path
     */
    static std::string make_key(const std::string& file_path);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace uldas
