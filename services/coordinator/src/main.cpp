#include <iostream>
#include <csignal>
#include <filesystem>
#include <pthread.h>
#include "../include/coordinator_config.hpp"
#include "../include/routes.hpp"

int main(int argc, char** argv) {
    try {
        CoordinatorConfig cfg = load_coordinator_config();
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i + 1 < argc) cfg.port = std::stoi(argv[++i]);
            else if (a == "--db" && i + 1 < argc) cfg.db_path = argv[++i];
        }
        auto parent = std::filesystem::path(cfg.db_path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);

        Database db(cfg.db_path);
        JobStore jobs(db);
        MinerRegistry miners(db);
        Dispatcher dispatcher(db, jobs, miners);
        Reaper reaper(jobs, miners, cfg.reaper);
        CoordinatorContext ctx{db, jobs, miners, dispatcher, &reaper, cfg.default_ttl_seconds};

        // Block before spawning threads so only sigwait below sees the signals.
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);

        HttpServer server(cfg.port, [&ctx](const HttpRequest& req){ return handle_coordinator_request(ctx, req); },
                          cfg.http_threads);
        std::cout << "[coordinator] Starting HTTP server on port " << cfg.port << " (db " << cfg.db_path << ")..." << std::endl;
        server.start();
        reaper.start();

        int sig = 0;
        sigwait(&set, &sig);
        std::cout << "[coordinator] Shutting down (signal " << sig << ")" << std::endl;

        reaper.stop();
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[coordinator] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
