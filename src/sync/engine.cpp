#include "als/sync/engine.hpp"

#include "als/events/events.hpp"
#include "als/hash/hash_store.hpp"
#include "als/identity/project.hpp"
#include "als/pairing/pairing.hpp"
#include "als/parser/claude_parser.hpp"
#include "als/parser/codex_parser.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iterator>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

namespace als::sync {
namespace {

std::int64_t to_unix_nanos(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return duration_cast<nanoseconds>(system_time.time_since_epoch()).count();
}

bool is_gone(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Progress groups Claude files by project directory and all Codex files
// under one name.
std::string project_key(const discovery::DiscoveredFile& file) {
    return file.agent == parser::AgentType::Claude ? file.project_hint : std::string("codex");
}

// Session id knowable from the path alone; "" for Codex files whose
// name carries no UUID (the id then comes from session_meta).
std::string session_id_from_path(const discovery::DiscoveredFile& file) {
    if (file.agent == parser::AgentType::Claude) {
        return file.path.stem().string();
    }
    const std::string uuid = discovery::extract_uuid_from_rollout(file.path.filename().string());
    return uuid.empty() ? std::string{} : parser::kCodexIdPrefix + uuid;
}

} // namespace

Engine::Engine(store::SessionStore& store, EngineConfig config, events::EventBus* bus)
    : store_(store), config_(std::move(config)), bus_(bus) {}

SyncStats Engine::sync_all(const ProgressFn& progress, const std::atomic<bool>* cancel) {
    const auto started = std::chrono::steady_clock::now();

    auto files = discovery::discover_claude_projects(config_.claude_projects_dir);
    auto codex = discovery::discover_codex_sessions(config_.codex_sessions_dir);
    files.insert(files.end(), std::make_move_iterator(codex.begin()), std::make_move_iterator(codex.end()));

    prune_failures(files);

    std::unordered_map<std::string, std::size_t> remaining;
    for (const auto& file : files) {
        ++remaining[project_key(file)];
    }

    SyncStats stats;
    stats.total_sessions = files.size();

    events::SyncStartedEvent start_event;
    start_event.files_total = files.size();
    publish(start_event);

    Progress current;
    current.phase = ProgressPhase::Scanning;
    current.sessions_total = files.size();
    current.projects_total = remaining.size();
    if (progress) {
        progress(current);
    }

    current.phase = ProgressPhase::Syncing;
    for (const auto& file : files) {
        if (cancel != nullptr && cancel->load()) {
            spdlog::info("sync cancelled after {} of {} files", current.sessions_done, files.size());
            break;
        }

        const FileResult result = process_file(file, false);
        switch (result.outcome) {
            case Outcome::Synced:
                stats.record_synced();
                ++current.sessions_synced;
                current.messages_indexed += static_cast<std::size_t>(result.message_count);
                break;
            case Outcome::Skipped:
                stats.record_skip();
                ++current.sessions_skipped;
                break;
            case Outcome::Failed:
                stats.record_failed();
                ++current.sessions_failed;
                break;
        }

        const std::string key = project_key(file);
        current.current_project = file.agent == parser::AgentType::Claude
            ? identity::get_project_name(file.project_hint)
            : key;
        if (--remaining[key] == 0) {
            ++current.projects_done;
        }

        ++current.sessions_done;
        if (progress) {
            progress(current);
        }
    }

    current.phase = ProgressPhase::Done;
    if (progress) {
        progress(current);
    }

    events::SyncCompletedEvent done;
    done.total_sessions = stats.total_sessions;
    done.synced = stats.synced;
    done.skipped = stats.skipped;
    done.failed = stats.failed;
    done.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    publish(done);

    return stats;
}

Result<void> Engine::sync_single_session(const std::string& session_id) {
    const std::string path = find_source_file(session_id);
    if (path.empty()) {
        return Err<void>(ErrorCode::NotFound, "no source file for session " + session_id);
    }

    discovery::DiscoveredFile file;
    file.path = path;
    if (starts_with(session_id, parser::kCodexIdPrefix)) {
        file.agent = parser::AgentType::Codex;
    } else {
        file.agent = parser::AgentType::Claude;
        file.project_hint = file.path.parent_path().filename().string();
    }

    const FileResult result = process_file(file, true);
    if (result.outcome == Outcome::Failed && result.error) {
        return Err<void>(*result.error);
    }
    return Ok();
}

std::string Engine::find_source_file(const std::string& session_id) const {
    const std::string prefix = parser::kCodexIdPrefix;
    if (starts_with(session_id, prefix)) {
        return discovery::find_codex_source_file(config_.codex_sessions_dir, session_id.substr(prefix.size()));
    }
    return discovery::find_claude_source_file(config_.claude_projects_dir, session_id);
}

Engine::FileResult Engine::process_file(const discovery::DiscoveredFile& file, bool force) {
    const std::string path = file.path.string();

    std::error_code ec;
    const auto status = fs::status(file.path, ec);
    if (!ec && !fs::exists(status)) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    fs::file_time_type mtime{};
    if (!ec) {
        mtime = fs::last_write_time(file.path, ec);
    }
    // Non-regular files have no size; hashing rejects them below and the
    // failure is cached by mtime like any unreadable file.
    std::uintmax_t size = 0;
    if (!ec && fs::is_regular_file(status)) {
        size = fs::file_size(file.path, ec);
    }
    if (ec) {
        if (is_gone(ec)) {
            forget_failure(path);
            return fail(file, Error{ErrorCode::NotFound, "stat " + path + ": " + ec.message()});
        }
        {
            // Transient: keep whatever we knew and assume the file is unchanged.
            std::lock_guard lock(failed_mutex_);
            if (!force && failed_files_.count(path) > 0) {
                return skip(file);
            }
        }
        const ErrorCode code = ec == std::errc::permission_denied ? ErrorCode::PermissionDenied
                                                                  : ErrorCode::IOError;
        return fail(file, Error{code, "stat " + path + ": " + ec.message()});
    }

    if (!force && unchanged_failure(path, mtime)) {
        return skip(file);
    }

    auto hash = hash::digest_file(file.path);
    if (hash.is_error()) {
        if (hash.error().code == ErrorCode::NotFound) {
            forget_failure(path);
        } else {
            remember_failure(path, mtime);
        }
        return fail(file, hash.error());
    }
    const std::string& file_hash = hash.value();
    const auto file_size = static_cast<std::int64_t>(size);

    auto unchanged = [&](const std::string& id) -> Result<bool> {
        auto info = store_.get_session_file_info(id);
        if (info.is_error()) {
            return Err<bool>(info.error());
        }
        const auto& stored = info.value();
        return Ok(stored.has_value() && stored->size == file_size && stored->hash == file_hash);
    };

    std::string session_id = session_id_from_path(file);
    if (!force && !session_id.empty()) {
        auto same = unchanged(session_id);
        if (same.is_error()) {
            return fail(file, same.error());
        }
        if (same.value()) {
            forget_failure(path);
            return skip(file);
        }
    }

    auto parsed = file.agent == parser::AgentType::Claude
        ? parser::parse_claude_session(file.path, identity::get_project_name(file.project_hint), config_.machine)
        : parser::parse_codex_session(file.path, config_.machine);
    if (parsed.is_error()) {
        remember_failure(path, mtime);
        return fail(file, parsed.error());
    }

    parser::ParsedSession& session = parsed.value().session;
    std::vector<parser::ParsedMessage>& messages = parsed.value().messages;

    if (session_id.empty()) {
        session_id = session.id;
        if (!force) {
            auto same = unchanged(session_id);
            if (same.is_error()) {
                return fail(file, same.error());
            }
            if (same.value()) {
                forget_failure(path);
                return skip(file);
            }
        }
    }

    pairing::pair_and_filter(messages);
    const auto [total, user] = pairing::post_filter_counts(messages);
    session.message_count = total;
    session.user_message_count = user;
    session.mcp_servers = pairing::extract_mcp_servers(messages);

    auto existing = store_.get_session_full(session.id);
    if (existing.is_error()) {
        return fail(file, existing.error());
    }
    const std::string stored_project = existing.value() ? existing.value()->project : std::string{};
    session.project = identity::resolve_project(stored_project, derive_project(file, session.project));

    session.machine = config_.machine;
    session.file_path = path;
    session.file_size = file_size;
    session.file_mtime = to_unix_nanos(mtime);
    session.file_hash = file_hash;

    auto written = store_.write_session(session, messages);
    if (written.is_error()) {
        return fail(file, written.error());
    }
    forget_failure(path);

    events::SessionSyncedEvent synced;
    synced.session_id = session.id;
    synced.path = path;
    synced.agent = session.agent;
    synced.message_count = session.message_count;
    synced.forced = force;
    publish(synced);

    FileResult result;
    result.outcome = Outcome::Synced;
    result.message_count = session.message_count;
    return result;
}

std::string Engine::derive_project(const discovery::DiscoveredFile& file,
                                   const std::string& parsed_project) const {
    if (file.agent == parser::AgentType::Claude) {
        return identity::get_project_name(file.project_hint);
    }
    return parsed_project;
}

Engine::FileResult Engine::fail(const discovery::DiscoveredFile& file, Error error) {
    spdlog::warn("sync {}: {}", file.path.string(), error.message);

    events::SessionFailedEvent failed;
    failed.path = file.path.string();
    failed.code = error.code;
    failed.reason = error.message;
    publish(failed);

    FileResult result;
    result.outcome = Outcome::Failed;
    result.error = std::move(error);
    return result;
}

Engine::FileResult Engine::skip(const discovery::DiscoveredFile& file) {
    events::SessionSkippedEvent skipped;
    skipped.path = file.path.string();
    publish(skipped);

    FileResult result;
    result.outcome = Outcome::Skipped;
    return result;
}

void Engine::remember_failure(const std::string& path, fs::file_time_type mtime) {
    std::lock_guard lock(failed_mutex_);
    failed_files_[path] = mtime;
}

void Engine::forget_failure(const std::string& path) {
    std::lock_guard lock(failed_mutex_);
    failed_files_.erase(path);
}

void Engine::prune_failures(const std::vector<discovery::DiscoveredFile>& files) {
    std::unordered_set<std::string> present;
    for (const auto& file : files) {
        present.insert(file.path.string());
    }
    std::lock_guard lock(failed_mutex_);
    for (auto it = failed_files_.begin(); it != failed_files_.end();) {
        if (present.count(it->first) == 0) {
            it = failed_files_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t Engine::failed_file_count() const {
    std::lock_guard lock(failed_mutex_);
    return failed_files_.size();
}

bool Engine::unchanged_failure(const std::string& path, fs::file_time_type mtime) const {
    std::lock_guard lock(failed_mutex_);
    auto it = failed_files_.find(path);
    return it != failed_files_.end() && it->second == mtime;
}

} // namespace als::sync
