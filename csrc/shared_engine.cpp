#include "shared_engine.h"

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

#include "espeak_engine.h"
#include "log.h"

namespace speak {

namespace {

struct GlobalState {
    std::mutex mutex;
    std::optional<EngineConfig> config;
    SharedEngineHandle instance;
};

// The logger is created first so that it outlives the global engine.
GlobalState& globalState() {
    logger();
    static GlobalState state;
    return state;
}

}  // namespace

SharedEngine::SharedEngine(EngineHandle engine) : engine{std::move(engine)} {
    if (this->engine == nullptr) {
        throw std::invalid_argument("SharedEngine requires an engine");
    }
}

EngineLease SharedEngine::acquire() {
    return EngineLease(std::unique_lock(mutex), engine.get());
}

SharedEngineHandle SharedEngine::global() {
    auto& g = globalState();
    std::lock_guard guard(g.mutex);
    if (g.instance == nullptr) {
        auto config = g.config ? *g.config : EngineConfig::fromEnv();
        setLogLevel(config.logLevel);
        g.instance = std::make_shared<SharedEngine>(
            std::make_shared<EspeakEngine>(config));
    }
    return g.instance;
}

void SharedEngine::configure(EngineConfig config) {
    auto& g = globalState();
    std::lock_guard guard(g.mutex);
    if (g.instance != nullptr) {
        throw std::logic_error(
            "speakxx: engine already initialized, configure() must be "
            "called before first use");
    }
    g.config = std::move(config);
}

int sampleRate() {
    auto engine = SharedEngine::global()->acquire();
    return engine->sampleRate();
}

}  // namespace speak
