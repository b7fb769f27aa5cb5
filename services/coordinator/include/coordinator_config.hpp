#pragma once
#include <string>
#include "reaper.hpp"

struct CoordinatorConfig {
    int port{8011};
    std::string db_path{"./data/coordinator.db"};
    int default_ttl_seconds{900};
    unsigned int http_threads{8};
    ReaperConfig reaper;
};

// COORDINATOR_* environment variables over the defaults above.
CoordinatorConfig load_coordinator_config();
