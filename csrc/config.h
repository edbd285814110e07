#pragma once

#include <string>

namespace speak {

// Options used to initialize the speech engine. The engine is initialized
// once per process, so these only take effect before its first use.
struct EngineConfig {
    // Directory containing espeak-ng-data. Empty uses the engine's default
    // search path (which honours ESPEAK_DATA_PATH).
    std::string dataPath{};

    // Length in milliseconds of the sample chunks handed to the synthesis
    // callback. 0 lets the engine choose (200 ms).
    int bufferLength{0};

    // Emit Phoneme events during synthesis.
    bool phonemeEvents{false};

    // Report phonemes as IPA instead of espeak mnemonics. Implies
    // phonemeEvents.
    bool ipaPhonemes{false};

    std::string logLevel{"warn"};

    // Defaults, overridden by SPEAKXX_DATA_PATH, SPEAKXX_BUFFER_MS,
    // SPEAKXX_PHONEME_EVENTS, SPEAKXX_IPA_PHONEMES and SPEAKXX_LOG_LEVEL.
    static EngineConfig fromEnv();
};

}  // namespace speak
