#pragma once

#include <string>
#include <string_view>

#include "engine.h"
#include "events.h"
#include "shared_engine.h"
#include "types.h"

namespace speak {

// Speech parameters and the output of the last synthesis call.
//
// Several Contexts may exist at once and be used from different threads,
// but each Context must only be used by one thread at a time. The engine
// itself is shared and serialized through SharedEngine.
struct Context {
    static constexpr int kDefaultRate = 175;
    static constexpr int kDefaultVolume = 100;
    static constexpr int kDefaultPitch = 50;
    static constexpr int kDefaultRange = 50;

    // Uses the process-wide engine.
    Context();
    explicit Context(SharedEngineHandle engine);

    // Speed of speech in words per minute.
    int rate() const { return rate_; }
    // Loudness as a percentage of the default volume.
    int volume() const { return volume_; }
    // Base pitch; 50 is the voice's normal pitch.
    int pitch() const { return pitch_; }
    // Pitch range; 0 is monotone, 50 the voice's normal range.
    int range() const { return range_; }

    // wpm must be between 80 and 450, inclusive.
    void setRate(int wpm);
    // percentage must not be negative. Values over 100 may clip.
    void setVolume(int percentage);
    // pitch must be between 0 (very low) and 100 (very high).
    void setPitch(int pitch);
    // range must be between 0 (monotone) and 100.
    void setRange(int range);

    // Select a voice by name. Throws std::invalid_argument if name is empty.
    void setVoice(std::string const& name);

    // Select the voice for future synthesis. Empty or zero arguments are
    // ignored; variant picks among several matching voices. The query is
    // checked against the engine first: if nothing matches, Error is thrown
    // and the current voice is kept.
    void setVoiceProperties(std::string const& name,
                            std::string const& language, Gender gender,
                            uint8_t age, uint8_t variant);

    VoiceQuery const& voice() const { return voice_; }

    // Convert text to speech, replacing samples() and events(). SSML tags
    // are passed to the engine unchanged.
    void synthesizeText(std::string_view text);

    // PCM samples of the last synthesis, at the engine's sample rate.
    Samples const& samples() const { return samples_; }
    // Word and sentence placement, marks and phonemes of the last synthesis.
    SynthEventList const& events() const { return events_; }

    // samples() as an IntTensor [nSample, 1].
    [[nodiscard]] Tensor wave() const;

   private:
    SharedEngineHandle engine_;

    int rate_{kDefaultRate};
    int volume_{kDefaultVolume};
    int pitch_{kDefaultPitch};
    int range_{kDefaultRange};
    VoiceQuery voice_{};

    Samples samples_{};
    SynthEventList events_{};
};

}  // namespace speak
