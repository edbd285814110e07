#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "types.h"

namespace speak {

// Gender of a voice. Values match espeak_VOICE::gender.
enum class Gender : uint8_t {
    Unknown = 0,
    Male = 1,
    Female = 2,
    Neutral = 3,
};

// A language supported by a voice.
struct Language {
    // Lower numbers mean the voice is more preferred for this language.
    uint8_t priority{};
    // Often BCP47, but not required to be.
    std::string name{};
};

struct Voice {
    std::string name{};  // Unique within the catalog.
    std::vector<Language> languages{};
    // File name of the voice within espeak-ng-data/voices.
    std::string identifier{};
    Gender gender{Gender::Unknown};
    uint8_t age{};  // In years, 0 if not specified.
};

using VoiceList = std::vector<Voice>;

// Partial specification of a voice. Empty or zero fields do not constrain
// the match; variant picks among several voices matching the rest.
struct VoiceQuery {
    std::string name{};
    std::string language{};
    Gender gender{Gender::Unknown};
    uint8_t age{};
    uint8_t variant{};

    bool empty() const {
        return name.empty() and language.empty() and
               gender == Gender::Unknown and age == 0 and variant == 0;
    }
    bool operator==(VoiceQuery const&) const = default;
};

// The speech engine. Implementations are not reentrant: callers serialize
// every call through SharedEngine. Failures are thrown as speak::Error.
struct Engine {
    virtual void setRate(int wpm) = 0;
    virtual void setVolume(int percentage) = 0;
    virtual void setPitch(int pitch) = 0;
    virtual void setTone(int range) = 0;

    // Select the voice used by following synthesize calls. Throws if no
    // voice matches.
    virtual void setVoice(VoiceQuery const& query) = 0;

    virtual VoiceList listVoices() = 0;

    // Samples per second of the generated audio.
    virtual int sampleRate() = 0;

    // Synthesize UTF-8 text (SSML accepted). callback is invoked
    // synchronously, zero or more times, before this returns.
    virtual void synthesize(std::string_view text,
                            SynthCallback const& callback) = 0;

    virtual ~Engine() = default;
};

}  // namespace speak
