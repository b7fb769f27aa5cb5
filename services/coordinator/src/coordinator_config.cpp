#include "../include/coordinator_config.hpp"
#include "errors.hpp"
#include "util.hpp"

CoordinatorConfig load_coordinator_config() {
    CoordinatorConfig cfg;
    cfg.port = getenv_int("COORDINATOR_PORT", cfg.port);
    cfg.db_path = getenv_or("COORDINATOR_DB_PATH", cfg.db_path);
    cfg.default_ttl_seconds = getenv_int("COORDINATOR_DEFAULT_TTL_SECONDS", cfg.default_ttl_seconds);
    cfg.http_threads = (unsigned int)getenv_int("COORDINATOR_HTTP_THREADS", (int)cfg.http_threads);
    cfg.reaper.interval_seconds = getenv_int("COORDINATOR_REAPER_INTERVAL_SECONDS", cfg.reaper.interval_seconds);
    cfg.reaper.heartbeat_timeout_seconds =
        getenv_int("COORDINATOR_HEARTBEAT_TIMEOUT_SECONDS", cfg.reaper.heartbeat_timeout_seconds);
    if (cfg.reaper.interval_seconds < 1) throw ValidationError("reaper interval must be at least 1 second");
    if (cfg.default_ttl_seconds < 1) throw ValidationError("default ttl must be at least 1 second");
    return cfg;
}
