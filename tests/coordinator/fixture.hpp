#pragma once
#include <gtest/gtest.h>
#include "../test_clock.hpp"
#include "dispatcher.hpp"

class CoordinatorTest : public ::testing::Test {
protected:
    ManualClock clock;
    Database db{":memory:"};
    JobStore jobs{db, clock.fn()};
    MinerRegistry miners{db, clock.fn()};
    Dispatcher dispatcher{db, jobs, miners, clock.fn()};

    static nlohmann::json payload() { return {{"prompt", "hello"}}; }

    static Capabilities a100_caps() {
        Capabilities caps;
        caps.gpus.push_back(GpuSpec{"A100", 40960});
        caps.cuda = "12.2";
        caps.models = {"llama3-8b", "sdxl"};
        caps.price = 1.5;
        return caps;
    }

    Miner register_miner(const std::string& id, Capabilities caps, int concurrency = 1,
                         std::optional<std::string> region = std::nullopt) {
        MinerRegistration reg;
        reg.capabilities = std::move(caps);
        reg.concurrency = concurrency;
        reg.region = std::move(region);
        return miners.register_miner(id, reg);
    }
};
