/**
 * @file components.hpp
 * @brief Ready-made subscribers for sync events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * Engine engine(store, config, &bus);
 */

#pragma once

#include "als/events/event_bus.hpp"
#include "als/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace als::events {

/**
 * @brief Logs every sync event with spdlog
 *
 * Pass boundaries at info, per-session outcomes at debug. The engine
 * already warns about failures itself, so they are only traced here.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<SyncStartedEvent>([](const SyncStartedEvent& e) {
            spdlog::info("[SyncStarted] files={}", e.files_total);
        });

        bus.subscribe<SessionSyncedEvent>([](const SessionSyncedEvent& e) {
            spdlog::debug("[SessionSynced] id={} agent={} messages={} forced={} path={}",
                          e.session_id, parser::to_string(e.agent), e.message_count, e.forced, e.path);
        });

        bus.subscribe<SessionSkippedEvent>([](const SessionSkippedEvent& e) {
            spdlog::debug("[SessionSkipped] path={}", e.path);
        });

        bus.subscribe<SessionFailedEvent>([](const SessionFailedEvent& e) {
            spdlog::debug("[SessionFailed] path={} code={} reason={}", e.path, to_string(e.code), e.reason);
        });

        bus.subscribe<SyncCompletedEvent>([](const SyncCompletedEvent& e) {
            spdlog::info("[SyncCompleted] total={} synced={} skipped={} failed={} duration={}ms",
                         e.total_sessions, e.synced, e.skipped, e.failed, e.duration.count());
        });
    }
};

/**
 * @brief Running counters across all passes on one bus
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> passes_completed{0};
        std::atomic<uint64_t> sessions_synced{0};
        std::atomic<uint64_t> sessions_skipped{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> tombstones_written{0};
        std::atomic<uint64_t> messages_indexed{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<SessionSyncedEvent>([this](const SessionSyncedEvent& e) {
            stats_.sessions_synced++;
            if (e.message_count == 0) {
                stats_.tombstones_written++;
            }
            stats_.messages_indexed += static_cast<uint64_t>(e.message_count);
        });

        bus.subscribe<SessionSkippedEvent>([this](const SessionSkippedEvent&) {
            stats_.sessions_skipped++;
        });

        bus.subscribe<SessionFailedEvent>([this](const SessionFailedEvent&) {
            stats_.sessions_failed++;
        });

        bus.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent&) {
            stats_.passes_completed++;
        });
    }

    const Stats& get_stats() const { return stats_; }

    void print_stats() const {
        spdlog::info("Sync statistics:");
        spdlog::info("  passes:    {}", stats_.passes_completed.load());
        spdlog::info("  synced:    {}", stats_.sessions_synced.load());
        spdlog::info("  skipped:   {}", stats_.sessions_skipped.load());
        spdlog::info("  failed:    {}", stats_.sessions_failed.load());
        spdlog::info("  tombstones:{}", stats_.tombstones_written.load());
        spdlog::info("  messages:  {}", stats_.messages_indexed.load());
    }

private:
    Stats stats_;
};

} // namespace als::events
