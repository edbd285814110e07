#include "context.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "audio.h"
#include "event_decoder.h"
#include "log.h"
#include "voices.h"

namespace speak {

Context::Context() : Context{SharedEngine::global()} {}

Context::Context(SharedEngineHandle engine) : engine_{std::move(engine)} {
    if (engine_ == nullptr) {
        throw std::invalid_argument("Context requires an engine");
    }
}

void Context::setRate(int wpm) {
    if (wpm < 80 || wpm > 450) {
        throw std::invalid_argument(
            "Context::setRate: wpm must be between 80 and 450");
    }
    rate_ = wpm;
}

void Context::setVolume(int percentage) {
    if (percentage < 0) {
        throw std::invalid_argument(
            "Context::setVolume: percentage must not be negative");
    }
    volume_ = percentage;
}

void Context::setPitch(int pitch) {
    if (pitch < 0 || pitch > 100) {
        throw std::invalid_argument(
            "Context::setPitch: pitch must be between 0 and 100");
    }
    pitch_ = pitch;
}

void Context::setRange(int range) {
    if (range < 0 || range > 100) {
        throw std::invalid_argument(
            "Context::setRange: range must be between 0 and 100");
    }
    range_ = range;
}

void Context::setVoice(std::string const& name) {
    if (name.empty()) {
        throw std::invalid_argument("Context::setVoice: missing name");
    }
    setVoiceProperties(name, "", Gender::Unknown, 0, 0);
}

void Context::setVoiceProperties(std::string const& name,
                                 std::string const& language, Gender gender,
                                 uint8_t age, uint8_t variant) {
    auto query = VoiceQuery{.name = name,
                            .language = language,
                            .gender = gender,
                            .age = age,
                            .variant = variant};
    validateVoice(*engine_, query);
    voice_ = std::move(query);
}

void Context::synthesizeText(std::string_view text) {
    samples_.clear();
    events_.clear();

    Samples samples;
    SynthEventList events;
    EventDecoder decoder;
    {
        auto engine = engine_->acquire();
        engine->setRate(rate_);
        engine->setVolume(volume_);
        engine->setPitch(pitch_);
        engine->setTone(range_);
        engine->setVoice(voice_);
        engine->synthesize(text, [&](SampleSpan chunk, ByteSpan records) {
            append_span(samples, chunk);
            decoder.feed(records, events);
        });
    }
    logger()->debug("synthesized {} characters: {} samples, {} events",
                    text.size(), samples.size(), events.size());

    samples_ = std::move(samples);
    events_ = std::move(events);
}

Tensor Context::wave() const { return samplesToWave(samples_); }

}  // namespace speak
