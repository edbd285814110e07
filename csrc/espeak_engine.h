#pragma once

#include <espeak-ng/speak_lib.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config.h"
#include "engine.h"
#include "event_decoder.h"
#include "log.h"
#include "types.h"

namespace speak {

// Engine backed by the espeak-ng library in synchronous mode. espeak-ng
// keeps its state in globals, so only one instance may exist per process.
struct EspeakEngine final : Engine {
    // No copy or move allowed!
    EspeakEngine(const EspeakEngine&) = delete;
    EspeakEngine& operator=(const EspeakEngine&) = delete;
    EspeakEngine(EspeakEngine&&) = delete;
    EspeakEngine& operator=(EspeakEngine&&) = delete;

    explicit EspeakEngine(EngineConfig const& config);
    ~EspeakEngine() override;

    void setRate(int wpm) override;
    void setVolume(int percentage) override;
    void setPitch(int pitch) override;
    void setTone(int range) override;
    void setVoice(VoiceQuery const& query) override;
    VoiceList listVoices() override;
    int sampleRate() override;
    void synthesize(std::string_view text,
                    SynthCallback const& callback) override;

   private:
    // Outlives the static library logger at exit.
    std::shared_ptr<spdlog::logger> log_{logger()};
};

// Decode espeak-ng's packed language list: repeated
// [priority byte][NUL-terminated name], ended by a zero priority byte.
std::vector<Language> parseLanguages(char const* packed);

namespace detail {

// State of the synthesis call in flight, reached through user_data.
struct SynthState {
    SynthCallback const* callback{};
    std::vector<std::byte> records{};
    std::exception_ptr error{};
};

// Convert one native event. Long Mark/Play names go to names.
EventRecord toRecord(espeak_EVENT const& e, std::string& names);

// Convert a LIST_TERMINATED ended event array to one chunk: the records,
// the sentinel, then the name table. Replaces the content of out.
void encodeEvents(espeak_EVENT const* events, std::vector<std::byte>& out);

// The espeak_SetSynthCallback target. Returns 1 to stop the engine when the
// events are not from one of our calls, or when the callback has thrown;
// the exception is then kept in the SynthState.
int synthCallback(short* wav, int numsamples, espeak_EVENT* events);

}  // namespace detail

}  // namespace speak
