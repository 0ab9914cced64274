#include "als/config/config.hpp"
#include "als/events/components.hpp"
#include "als/events/event_bus.hpp"
#include "als/store/sqlite_session_store.hpp"
#include "als/sync/engine.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> g_cancel{false};

void handle_signal(int) {
    g_cancel.store(true);
}

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-v|--verbose] [session-id]\n"
              << "  with no session id, sync every Claude and Codex session file\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    bool verbose = false;
    std::string session_id;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (session_id.empty() && arg[0] != '-') {
            session_id = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    auto loaded = als::config::load();
    if (loaded.is_error()) {
        spdlog::error("config: {}", loaded.error().message);
        return 1;
    }
    const auto& cfg = loaded.value();
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(cfg.log_level));

    auto opened = als::store::SqliteSessionStore::open(cfg.db_path);
    if (opened.is_error()) {
        spdlog::error("store: {}", opened.error().message);
        return 1;
    }
    auto& store = *opened.value();

    als::events::EventBus bus;
    als::events::LoggerComponent logger(bus);
    als::events::MetricsComponent metrics(bus);

    als::sync::EngineConfig engine_config;
    engine_config.claude_projects_dir = cfg.claude_projects_dir;
    engine_config.codex_sessions_dir = cfg.codex_sessions_dir;
    engine_config.machine = cfg.machine;
    als::sync::Engine engine(store, engine_config, &bus);

    if (!session_id.empty()) {
        auto synced = engine.sync_single_session(session_id);
        if (synced.is_error()) {
            spdlog::error("sync {}: {}", session_id, synced.error().message);
            return 1;
        }
        spdlog::info("synced {}", session_id);
        return 0;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const auto stats = engine.sync_all(
        [](const als::sync::Progress& p) {
            if (p.phase == als::sync::ProgressPhase::Scanning) {
                std::fprintf(stderr, "%zu files in %zu projects\n", p.sessions_total, p.projects_total);
                return;
            }
            std::fprintf(stderr, "\r%zu/%zu sessions (%.0f%%) %zu synced %zu skipped %zu failed %zu messages",
                         p.sessions_done, p.sessions_total, p.percent(), p.sessions_synced,
                         p.sessions_skipped, p.sessions_failed, p.messages_indexed);
        },
        &g_cancel);
    std::fprintf(stderr, "\n");

    spdlog::info("{} synced, {} skipped, {} failed of {} sessions",
                 stats.synced, stats.skipped, stats.failed, stats.total_sessions);
    if (verbose) {
        metrics.print_stats();
    }
    return 0;
}
