#include "espeak_engine.h"

#include <espeak-ng/espeak_ng.h>

#include <atomic>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "error.h"
#include "event_decoder.h"
#include "log.h"

namespace speak {

namespace {

std::atomic<bool> engine_exists{false};

void setParameter(espeak_PARAMETER parameter, int value, char const* name) {
    logger()->debug("set {} to {}", name, value);
    checkStatus(espeak_ng_SetParameter(parameter, value, 0), name);
}

}  // namespace

namespace detail {

EventRecord toRecord(espeak_EVENT const& e, std::string& names) {
    EventRecord r;
    r.type = static_cast<int32_t>(e.type);
    r.uniqueIdentifier = static_cast<int32_t>(e.unique_identifier);
    r.textPosition = e.text_position;
    r.length = e.length;
    r.audioPosition = e.audio_position;
    r.sample = e.sample;
    switch (e.type) {
        case espeakEVENT_WORD:
        case espeakEVENT_SENTENCE:
        case espeakEVENT_SAMPLERATE:
            r.setNumber(e.id.number);
            break;
        case espeakEVENT_MARK:
        case espeakEVENT_PLAY:
            r.setName(e.id.name ? e.id.name : "", names);
            break;
        case espeakEVENT_PHONEME:
            r.setString(std::string_view(
                e.id.string, strnlen(e.id.string, sizeof(e.id.string))));
            break;
        default:
            break;
    }
    return r;
}

void encodeEvents(espeak_EVENT const* events, std::vector<std::byte>& out) {
    out.clear();
    std::string names;
    for (auto e = events; e->type != espeakEVENT_LIST_TERMINATED; ++e) {
        appendRecord(toRecord(*e, names), out);
    }
    appendRecord(EventRecord{}, out);
    appendNames(names, out);
}

int synthCallback(short* wav, int numsamples, espeak_EVENT* events) {
    if (events == nullptr || events->user_data == nullptr) {
        // Not one of ours; stop the engine.
        return 1;
    }
    auto state = static_cast<SynthState*>(events->user_data);
    if (state->error) return 1;
    try {
        encodeEvents(events, state->records);
        auto samples = wav == nullptr || numsamples <= 0
                           ? SampleSpan{}
                           : SampleSpan(wav, static_cast<size_t>(numsamples));
        (*state->callback)(samples, ByteSpan(state->records));
    } catch (...) {
        // Exceptions must not unwind through espeak-ng; rethrown by
        // synthesize once the engine returns.
        state->error = std::current_exception();
        return 1;
    }
    return 0;
}

}  // namespace detail

std::vector<Language> parseLanguages(char const* packed) {
    std::vector<Language> languages;
    if (packed == nullptr) return languages;
    auto p = packed;
    while (*p != '\0') {
        auto priority = static_cast<uint8_t>(*p++);
        std::string name(p);
        p += name.size() + 1;
        languages.push_back(Language{priority, std::move(name)});
    }
    return languages;
}

EspeakEngine::EspeakEngine(EngineConfig const& config) {
    if (engine_exists.exchange(true)) {
        throw std::logic_error(
            "speakxx: only one EspeakEngine may exist per process");
    }
    espeak_ng_InitializePath(
        config.dataPath.empty() ? nullptr : config.dataPath.c_str());
    espeak_ng_ERROR_CONTEXT context = nullptr;
    auto status = espeak_ng_Initialize(&context);
    espeak_ng_ClearErrorContext(&context);
    if (status != ENS_OK) {
        engine_exists = false;
        checkStatus(status, "espeak_ng_Initialize");
    }
    try {
        checkStatus(espeak_ng_InitializeOutput(ENOUTPUT_MODE_SYNCHRONOUS,
                                               config.bufferLength, nullptr),
                    "espeak_ng_InitializeOutput");
        auto phonemes = config.phonemeEvents || config.ipaPhonemes;
        checkStatus(espeak_ng_SetPhonemeEvents(phonemes, config.ipaPhonemes),
                    "espeak_ng_SetPhonemeEvents");
        espeak_SetSynthCallback(detail::synthCallback);
    } catch (...) {
        if (espeak_ng_Terminate() != ENS_OK) {
            log_->warn("espeak_ng_Terminate failed after a failed setup");
        }
        engine_exists = false;
        throw;
    }
    log_->info("espeak-ng initialized: data path '{}', {} Hz",
               config.dataPath.empty() ? "(default)" : config.dataPath,
               espeak_ng_GetSampleRate());
}

EspeakEngine::~EspeakEngine() {
    auto status = espeak_ng_Terminate();
    if (status != ENS_OK) {
        log_->error("espeak_ng_Terminate failed: {}", statusMessage(status));
    }
    engine_exists = false;
}

void EspeakEngine::setRate(int wpm) {
    setParameter(espeakRATE, wpm, "rate");
}

void EspeakEngine::setVolume(int percentage) {
    setParameter(espeakVOLUME, percentage, "volume");
}

void EspeakEngine::setPitch(int pitch) {
    setParameter(espeakPITCH, pitch, "pitch");
}

void EspeakEngine::setTone(int range) {
    setParameter(espeakRANGE, range, "range");
}

void EspeakEngine::setVoice(VoiceQuery const& query) {
    logger()->debug(
        "select voice name='{}' language='{}' gender={} age={} variant={}",
        query.name, query.language, static_cast<int>(query.gender),
        query.age, query.variant);
    if (query.empty()) {
        checkStatus(espeak_ng_SetVoiceByName(ESPEAKNG_DEFAULT_VOICE),
                    "espeak_ng_SetVoiceByName");
        return;
    }
    if (query == VoiceQuery{.name = query.name}) {
        checkStatus(espeak_ng_SetVoiceByName(query.name.c_str()),
                    "espeak_ng_SetVoiceByName");
        return;
    }
    espeak_VOICE spec;
    std::memset(&spec, 0, sizeof(spec));
    spec.name = query.name.empty() ? nullptr : query.name.c_str();
    spec.languages = query.language.empty() ? nullptr : query.language.c_str();
    spec.gender = static_cast<unsigned char>(query.gender);
    spec.age = query.age;
    spec.variant = query.variant;
    checkStatus(espeak_ng_SetVoiceByProperties(&spec),
                "espeak_ng_SetVoiceByProperties");
}

VoiceList EspeakEngine::listVoices() {
    VoiceList voices;
    auto list = espeak_ListVoices(nullptr);
    if (list == nullptr) return voices;
    for (auto v = list; *v != nullptr; ++v) {
        auto const& native = **v;
        voices.push_back(Voice{
            .name = native.name ? native.name : "",
            .languages = parseLanguages(native.languages),
            .identifier = native.identifier ? native.identifier : "",
            .gender = static_cast<Gender>(native.gender),
            .age = native.age,
        });
    }
    return voices;
}

int EspeakEngine::sampleRate() { return espeak_ng_GetSampleRate(); }

void EspeakEngine::synthesize(std::string_view text,
                              SynthCallback const& callback) {
    // espeak-ng reads up to the terminating NUL.
    auto const owned = std::string(text);
    detail::SynthState state{.callback = &callback};
    auto status = espeak_ng_Synthesize(
        owned.c_str(), owned.size() + 1, 0, POS_CHARACTER, 0,
        espeakCHARS_UTF8 | espeakSSML, nullptr, &state);
    if (state.error) std::rethrow_exception(state.error);
    checkStatus(status, "espeak_ng_Synthesize");
}

}  // namespace speak
