/**
 * @file events.hpp
 * @brief Events published by the sync engine
 *
 * NAMING CONVENTION:
 * Past tense, one struct per fact: SyncStartedEvent, SessionSyncedEvent.
 */

#pragma once

#include "als/core/error.hpp"
#include "als/parser/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace als::events {

/**
 * @brief A full pass is about to process `files_total` discovered files
 */
struct SyncStartedEvent {
    std::size_t files_total = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief A session was parsed and written
 *
 * message_count == 0 means a tombstone row was written.
 */
struct SessionSyncedEvent {
    std::string session_id;
    std::string path;
    parser::AgentType agent = parser::AgentType::Claude;
    int message_count = 0;
    bool forced = false;  // single-session resync, hash ignored
};

/**
 * @brief A file was left alone because its (size, hash) is unchanged or
 * it previously failed and has not been touched since
 */
struct SessionSkippedEvent {
    std::string path;
};

/**
 * @brief A file could not be read or its session could not be stored
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent (trace with path and reason)
 * - MetricsComponent (failure counter)
 */
struct SessionFailedEvent {
    std::string path;
    ErrorCode code = ErrorCode::IOError;
    std::string reason;
};

struct SyncCompletedEvent {
    std::size_t total_sessions = 0;
    std::size_t synced = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace als::events
