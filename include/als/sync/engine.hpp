#pragma once

#include "als/core/result.hpp"
#include "als/discovery/discovery.hpp"
#include "als/events/event_bus.hpp"
#include "als/store/session_store.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace als::sync {

struct EngineConfig {
    std::filesystem::path claude_projects_dir;
    std::filesystem::path codex_sessions_dir;
    std::string machine = "local";
};

enum class ProgressPhase {
    Scanning,
    Syncing,
    Done
};

inline const char* to_string(ProgressPhase phase) {
    switch (phase) {
        case ProgressPhase::Scanning: return "scanning";
        case ProgressPhase::Syncing: return "syncing";
        case ProgressPhase::Done: return "done";
    }
    return "unknown";
}

/**
 * @brief Snapshot handed to the progress sink
 *
 * sessions_done == sessions_synced + sessions_skipped + sessions_failed.
 * A project is a Claude project directory; Codex files are counted
 * under the single project "codex". current_project names the project of
 * the file just processed.
 */
struct Progress {
    ProgressPhase phase = ProgressPhase::Scanning;
    std::string current_project;
    std::size_t projects_total = 0;
    std::size_t projects_done = 0;
    std::size_t sessions_total = 0;
    std::size_t sessions_done = 0;
    std::size_t sessions_synced = 0;
    std::size_t sessions_skipped = 0;
    std::size_t sessions_failed = 0;
    std::size_t messages_indexed = 0;

    /// 0 when nothing was discovered.
    double percent() const {
        if (sessions_total == 0) {
            return 0.0;
        }
        return static_cast<double>(sessions_done) * 100.0 / static_cast<double>(sessions_total);
    }
};

/**
 * @brief Aggregate result of one pass
 *
 * synced + skipped + failed == files processed. A cancelled pass may
 * process fewer than total_sessions files.
 */
struct SyncStats {
    std::size_t total_sessions = 0;
    std::size_t synced = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;

    void record_skip() { ++skipped; }
    void record_synced(std::size_t n = 1) { synced += n; }
    void record_failed() { ++failed; }
};

using ProgressFn = std::function<void(const Progress&)>;

/**
 * @brief Drives discovery -> change check -> parse -> pair/filter ->
 * identity -> persist for Claude and Codex logs
 *
 * CHANGE DETECTION:
 * A file is skipped when the store already holds the same (size, hash)
 * for its session. Equal sizes are never trusted alone: the hash is the
 * authority. Files that failed to open or hash are remembered by
 * (path, mtime) and skipped until their mtime moves.
 *
 * FAILURES:
 * Nothing here aborts a pass. Unreadable files and store errors are
 * logged, counted as failed and published as SessionFailedEvent.
 *
 * THREAD SAFETY:
 * Concurrent passes on one engine are allowed; the failed-file cache is
 * guarded and the store serializes its own writes.
 */
class Engine {
public:
    Engine(store::SessionStore& store, EngineConfig config, events::EventBus* bus = nullptr);

    /**
     * @brief Sync every discovered Claude and Codex session file
     *
     * @param progress called once after discovery (Scanning), after each file
     *                 (Syncing) and once at the end (Done), also when
     *                 cancelled; may be empty
     * @param cancel   checked between files; may be null
     */
    SyncStats sync_all(const ProgressFn& progress = nullptr,
                       const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Re-read one session's file and rewrite it, ignoring the stored hash
     *
     * The stored project label is still preserved unless it is empty or
     * needs reparse. Fails with NotFound when no source file exists.
     */
    Result<void> sync_single_session(const std::string& session_id);

    /// "" when unknown. "codex:<uuid>" ids are looked up in the Codex tree.
    std::string find_source_file(const std::string& session_id) const;

    const EngineConfig& config() const noexcept { return config_; }

    /// Files currently remembered as unreadable.
    std::size_t failed_file_count() const;

private:
    enum class Outcome {
        Synced,
        Skipped,
        Failed
    };

    struct FileResult {
        Outcome outcome = Outcome::Skipped;
        int message_count = 0;
        std::optional<Error> error;
    };

    FileResult process_file(const discovery::DiscoveredFile& file, bool force);
    FileResult fail(const discovery::DiscoveredFile& file, Error error);
    FileResult skip(const discovery::DiscoveredFile& file);

    std::string derive_project(const discovery::DiscoveredFile& file,
                               const std::string& parsed_project) const;

    void remember_failure(const std::string& path, std::filesystem::file_time_type mtime);
    void forget_failure(const std::string& path);
    void prune_failures(const std::vector<discovery::DiscoveredFile>& files);
    bool unchanged_failure(const std::string& path, std::filesystem::file_time_type mtime) const;

    template<typename EventType>
    void publish(const EventType& event) {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    store::SessionStore& store_;
    EngineConfig config_;
    events::EventBus* bus_ = nullptr;

    mutable std::mutex failed_mutex_;
    std::unordered_map<std::string, std::filesystem::file_time_type> failed_files_;
};

} // namespace als::sync
