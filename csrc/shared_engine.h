#pragma once

#include <mutex>
#include <utility>

#include "config.h"
#include "engine.h"
#include "types.h"

namespace speak {

// Exclusive access to a shared engine, held until the lease is destroyed.
// A moved-from lease holds neither the lock nor the engine.
struct EngineLease {
    EngineLease(EngineLease&& other) noexcept
        : lock{std::move(other.lock)},
          engine{std::exchange(other.engine, nullptr)} {}
    EngineLease& operator=(EngineLease&& other) noexcept {
        lock = std::move(other.lock);
        engine = std::exchange(other.engine, nullptr);
        return *this;
    }

    explicit operator bool() const { return engine != nullptr; }

    Engine* operator->() const { return engine; }
    Engine& operator*() const { return *engine; }

   private:
    friend struct SharedEngine;
    EngineLease(std::unique_lock<std::mutex> lock, Engine* engine)
        : lock{std::move(lock)}, engine{engine} {}

    std::unique_lock<std::mutex> lock;
    Engine* engine;
};

// An engine shared by every Context. All engine calls go through acquire(),
// so at most one operation, including a whole synthesis call with its
// callbacks, runs against the engine at a time.
struct SharedEngine {
    // No copy or move allowed!
    SharedEngine(const SharedEngine&) = delete;
    SharedEngine& operator=(const SharedEngine&) = delete;
    SharedEngine(SharedEngine&&) = delete;
    SharedEngine& operator=(SharedEngine&&) = delete;

    explicit SharedEngine(EngineHandle engine);

    // Blocks until no other lease is alive.
    EngineLease acquire();

    // The process-wide espeak-ng engine. Created on first use from the
    // configuration passed to configure(), or EngineConfig::fromEnv().
    static SharedEngineHandle global();

    // Set the configuration of the process-wide engine. Throws
    // std::logic_error once the engine has been created.
    static void configure(EngineConfig config);

   private:
    std::mutex mutex;
    EngineHandle engine;
};

// Samples per second of the audio produced by the process-wide engine.
int sampleRate();

}  // namespace speak
