#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace speak {

// Values match espeak_EVENT_TYPE.
enum class SynthEventType : uint8_t {
    Word = 1,           // Start of a word.
    Sentence = 2,       // Start of a sentence.
    Mark = 3,           // A <mark/> element in SSML.
    Play = 4,           // An <audio/> element in SSML.
    End = 5,            // End of a sentence or clause.
    MsgTerminated = 6,  // End of the synthesized message.
    Phoneme = 7,        // A phoneme, when phoneme events are enabled.
};

char const* toString(SynthEventType type);

// Per-type payloads.
struct WordEvent {
    int number{};  // Word number within the message.
    int length{};  // Length of the word in characters.
};
struct SentenceEvent {
    int number{};
};
struct MarkEvent {
    std::string name{};
};
struct PlayEvent {
    std::string name{};
};
struct EndEvent {};
struct MsgTerminatedEvent {};
struct PhonemeEvent {
    std::string phoneme{};
};

// Alternatives are ordered like SynthEventType, so index() + 1 is the tag.
using EventPayload =
    std::variant<WordEvent, SentenceEvent, MarkEvent, PlayEvent, EndEvent,
                 MsgTerminatedEvent, PhonemeEvent>;

struct SynthEvent {
    // Position in characters from the start of the text, starting at 1.
    int textPosition{};

    // Time within the generated speech output.
    std::chrono::milliseconds audioPosition{};

    EventPayload payload{EndEvent{}};

    SynthEventType type() const {
        return static_cast<SynthEventType>(payload.index() + 1);
    }

    // The accessors below return zero values for events of a type that does
    // not carry the field.
    int length() const;
    int number() const;
    std::string name() const;
    std::string phoneme() const;
};

using SynthEventList = std::vector<SynthEvent>;

}  // namespace speak
