#include <iostream>
#include <csignal>
#include <filesystem>
#include <memory>
#include <pthread.h>
#include "../include/hub_routes.hpp"
#include "../include/memory_cache.hpp"
#include "../include/redis_cache.hpp"

int main(int argc, char** argv) {
    try {
        PoolHubSettings settings = load_pool_hub_settings();
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i + 1 < argc) settings.port = std::stoi(argv[++i]);
            else if (a == "--db" && i + 1 < argc) settings.db_path = argv[++i];
            else if (a == "--redis" && i + 1 < argc) settings.redis_url = argv[++i];
        }
        auto parent = std::filesystem::path(settings.db_path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);

        std::unique_ptr<CacheBackend> cache;
        if (settings.redis_url.empty()) {
            std::cout << "[pool-hub] POOLHUB_REDIS_URL not set, using in-process cache" << std::endl;
            cache = std::make_unique<MemoryCache>();
        } else {
            cache = std::make_unique<RedisCache>(settings.redis_url);
        }

        Database db(settings.db_path);
        PoolHubMetrics metrics;
        MinerRepository miners(db, *cache, settings, metrics);
        MatchRepository matches(db, *cache, settings, metrics);
        FeedbackRepository feedback(db, *cache, miners, metrics);
        Matcher matcher(miners, matches, metrics);
        PoolHubContext ctx{db, *cache, miners, matches, feedback, matcher, metrics};

        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);

        HttpServer server(settings.port, [&ctx](const HttpRequest& req){ return handle_pool_hub_request(ctx, req); },
                          settings.http_threads);
        std::cout << "[pool-hub] Starting HTTP server on port " << settings.port << " (db " << settings.db_path << ")..." << std::endl;
        server.start();

        int sig = 0;
        sigwait(&set, &sig);
        std::cout << "[pool-hub] Shutting down (signal " << sig << ")" << std::endl;
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[pool-hub] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
