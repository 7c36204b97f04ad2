#include "uldas/processing_tracker.h"
#include "test_common.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace uldas;
using uldas_test::check;

namespace {

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // anonymous namespace

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Processing Tracker Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    const fs::path dir = fs::temp_directory_path() / "uldas_tracker_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    const fs::path movie = dir / "movie.mkv";
    const fs::path episode = dir / "episode.mkv";
    write_file(movie, "0123456789");
    write_file(episode, "abcdef");

    uldas_test::section("In-memory table");
    {
        ProcessingTracker tracker(":memory:");
        check(!tracker.is_processed(movie.string()), "unknown file is not processed");

        check(tracker.mark_processed(movie.string(), true, false), "mark audio processed");
        check(tracker.is_processed(movie.string()), "marked file is processed");

        auto entry = tracker.lookup(movie.string());
        check(entry.has_value(), "entry stored");
        check(entry && entry->audio_processed && !entry->subtitle_processed, "per-pass flags stored");
        check(entry && entry->size == 10, "size recorded");
        check(entry && !entry->processed_date.empty(), "processed date recorded");
        check(entry && entry->path == ProcessingTracker::make_key(movie.string()), "keyed by absolute path");

        check(!tracker.mark_processed(episode.string(), false, false), "nothing to record when both passes failed");
        check(!tracker.is_processed(episode.string()), "failed file stays unprocessed");

        uldas_test::section("Content identity");
        write_file(movie, "0123456789X");
        check(!tracker.is_processed(movie.string()), "1-byte change invalidates the entry");
        check(!tracker.lookup(movie.string()).has_value(), "stale entry removed");

        check(tracker.mark_processed(movie.string(), true, true), "re-mark after change");
        fs::last_write_time(movie, fs::last_write_time(movie) + std::chrono::seconds(30));
        check(!tracker.is_processed(movie.string()), "modification time change invalidates the entry");

        check(tracker.mark_processed(movie.string(), true, true), "re-mark after touch");
        fs::remove(movie);
        check(!tracker.is_processed(movie.string()), "deleted file is not processed");
        write_file(movie, "0123456789");

        uldas_test::section("Statistics and clearing");
        tracker.mark_processed(movie.string(), true, false);
        tracker.mark_processed(episode.string(), true, true);
        TrackingStats stats = tracker.get_stats();
        check(stats.total == 2, "two files tracked");
        check(stats.audio_only == 1 && stats.both == 1 && stats.subtitle_only == 0, "pass breakdown");

        check(tracker.mark_processed(movie.string(), true, true), "upsert existing entry");
        check(tracker.get_stats().both == 2, "entry updated in place");

        check(tracker.clear_entry(episode.string()), "clear one entry");
        check(tracker.get_stats().total == 1, "one entry left");
        check(tracker.clear_all(), "clear all");
        check(tracker.get_stats().total == 0, "table empty");
    }

    uldas_test::section("On-disk table");
    {
        const std::string db = (dir / "tracking" / "processed_files.db").string();
        fs::create_directories(dir / "tracking");
        {
            ProcessingTracker tracker(db);
            tracker.mark_processed(episode.string(), false, true);
        }
        ProcessingTracker reopened(db);
        auto entry = reopened.lookup(episode.string());
        check(entry && !entry->audio_processed && entry->subtitle_processed, "entries survive reopening");
    }

    {
        bool threw = false;
        try {
            // Parent is a regular file
            ProcessingTracker broken((episode / "db.sqlite").string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        check(threw, "unopenable database throws");
    }

    fs::remove_all(dir);
    return uldas_test::finish("Processing tracker");
}
