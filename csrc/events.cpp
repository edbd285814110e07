#include "events.h"

#include <string>
#include <variant>

namespace speak {

char const* toString(SynthEventType type) {
    switch (type) {
        case SynthEventType::Word:
            return "word";
        case SynthEventType::Sentence:
            return "sentence";
        case SynthEventType::Mark:
            return "mark";
        case SynthEventType::Play:
            return "play";
        case SynthEventType::End:
            return "end";
        case SynthEventType::MsgTerminated:
            return "msg_terminated";
        case SynthEventType::Phoneme:
            return "phoneme";
    }
    return "unknown";
}

int SynthEvent::length() const {
    if (auto p = std::get_if<WordEvent>(&payload)) return p->length;
    return 0;
}

int SynthEvent::number() const {
    if (auto p = std::get_if<WordEvent>(&payload)) return p->number;
    if (auto p = std::get_if<SentenceEvent>(&payload)) return p->number;
    return 0;
}

std::string SynthEvent::name() const {
    if (auto p = std::get_if<MarkEvent>(&payload)) return p->name;
    if (auto p = std::get_if<PlayEvent>(&payload)) return p->name;
    return {};
}

std::string SynthEvent::phoneme() const {
    if (auto p = std::get_if<PhonemeEvent>(&payload)) return p->phoneme;
    return {};
}

}  // namespace speak
