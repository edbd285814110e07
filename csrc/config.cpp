#include "config.h"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace speak {

namespace {

char const* env(char const* name) {
    auto value = std::getenv(name);
    if (value == nullptr || *value == '\0') return nullptr;
    return value;
}

bool parseFlag(std::string_view name, std::string_view value) {
    if (value == "1" || value == "true" || value == "on") return true;
    if (value == "0" || value == "false" || value == "off") return false;
    throw std::invalid_argument(std::string(name) +
                                " must be a boolean, got: " +
                                std::string(value));
}

}  // namespace

EngineConfig EngineConfig::fromEnv() {
    EngineConfig config;
    if (auto v = env("SPEAKXX_DATA_PATH")) config.dataPath = v;
    if (auto v = env("SPEAKXX_BUFFER_MS")) {
        config.bufferLength = std::stoi(v);
        if (config.bufferLength < 0) {
            throw std::invalid_argument(
                "SPEAKXX_BUFFER_MS must not be negative");
        }
    }
    if (auto v = env("SPEAKXX_PHONEME_EVENTS")) {
        config.phonemeEvents = parseFlag("SPEAKXX_PHONEME_EVENTS", v);
    }
    if (auto v = env("SPEAKXX_IPA_PHONEMES")) {
        config.ipaPhonemes = parseFlag("SPEAKXX_IPA_PHONEMES", v);
    }
    if (auto v = env("SPEAKXX_LOG_LEVEL")) config.logLevel = v;
    return config;
}

}  // namespace speak
