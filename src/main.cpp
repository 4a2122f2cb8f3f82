#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <filesystem>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/embedder.hpp"
#include "engine/embedding_cache.hpp"
#include "engine/request_handler.hpp"
#include "engine/snapshot_manager.hpp"

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[Cadence] Starting daemon (v0.1.0)...\n";

    auto config_dir = cadence::platform::system::get_config_dir();
    if (!config_dir.empty()) {
        std::filesystem::create_directories(config_dir);
    }
    auto config_path = cadence::engine::Config::locate(config_dir);
    if (argc > 1) config_path = argv[1];
    std::cout << "[Cadence] Config path: " << config_path << "\n";

    if (!std::filesystem::exists(config_path)) {
        cadence::engine::Config{}.save(config_path);
        std::cout << "[Cadence] Wrote default config.\n";
    }
    auto config = cadence::engine::Config::load(config_path);
    config.apply_environment();
    std::cout << "[Cadence] Catalog: " << config.catalog_path << "\n";

    std::shared_ptr<cadence::engine::Embedder> embedder;
    try {
        embedder = cadence::engine::create_embedder(config);
    } catch (const cadence::EmbedderError& e) {
        std::cerr << "[Cadence] Failed to create embedder: " << e.what() << "\n";
        return 1;
    }

    std::shared_ptr<cadence::engine::EmbeddingCache> cache;
    if (config.cache_enabled) {
        auto data_dir = cadence::platform::system::get_data_dir();
        if (!data_dir.empty()) {
            std::filesystem::create_directories(data_dir);
        } else {
            data_dir = std::filesystem::current_path(); // Fallback
        }
        std::filesystem::path db_path = data_dir / "cadence.db";
        std::cout << "[Cadence] Embedding cache: " << db_path << "\n";

        cache = std::make_shared<cadence::engine::EmbeddingCache>();
        if (!cache->open(db_path)) {
            std::cerr << "[Cadence] Continuing without embedding cache.\n";
            cache.reset();
        }
    }

    cadence::engine::BuildOptions options;
    options.concurrency = config.build_concurrency;
    cadence::engine::SnapshotManager snapshots(embedder, options, cache);

    // A bad catalog at startup is reported; the daemon keeps running so it can be fixed and republished.
    auto publish = [&snapshots](const std::filesystem::path& path) {
        try {
            snapshots.publish_file(path);
        } catch (const cadence::ValidationError& e) {
            std::cerr << "[Cadence] Catalog rejected: " << e.what() << "\n";
            for (const auto& issue : e.issues()) {
                std::cerr << "  entry " << issue.index << " [" << issue.field << "] " << issue.reason << "\n";
            }
        } catch (const cadence::EmbedderError& e) {
            std::cerr << "[Cadence] Snapshot build failed: " << e.what() << "\n";
        }
    };
    publish(config.catalog_path);

    auto bridge = cadence::platform::Bridge::create();
    if (!bridge || !bridge->listen(config.socket_name)) return 1;

    cadence::engine::RequestHandler handler(snapshots, config, [] { g_running = false; });
    bridge->set_handler([&handler](const std::string& request) { return handler.handle(request); });

    std::unique_ptr<cadence::platform::Sentry> sentry;
    std::thread sentry_thread;
    if (config.watch_catalog) {
        sentry = cadence::platform::Sentry::create();
        const auto catalog = std::filesystem::absolute(config.catalog_path).lexically_normal();
        sentry->set_callback([&publish, catalog](const cadence::platform::FileEvent& event) {
            if (event.path != catalog) return;
            if (event.type == cadence::platform::FileEvent::Type::Modified ||
                event.type == cadence::platform::FileEvent::Type::Created) {
                std::cout << "[Sentry] Catalog changed, republishing.\n";
                publish(catalog);
            }
        });
        if (sentry->add_watch(catalog.parent_path())) {
            sentry_thread = std::thread([&sentry]() { sentry->start(); });
        }
    }

    std::cout << "[Cadence] Ready.\n";
    std::thread bridge_thread([&bridge]() { bridge->run(); });

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::cout << "\n[Cadence] Shutting down...\n";
    bridge->stop();
    if (sentry) sentry->stop();
    if (bridge_thread.joinable()) bridge_thread.join();
    if (sentry_thread.joinable()) sentry_thread.join();

    return 0;
}
