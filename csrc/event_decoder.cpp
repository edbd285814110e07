#include "event_decoder.h"

#include <algorithm>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

#include "error.h"

namespace speak {

void EventRecord::setNumber(int32_t number) {
    id.fill('\0');
    std::memcpy(id.data(), &number, sizeof(number));
}

bool EventRecord::setString(std::string_view s) {
    id.fill('\0');
    auto n = std::min(s.size(), id.size());
    std::copy_n(s.data(), n, id.data());
    return n == s.size();
}

void EventRecord::setName(std::string_view name, std::string& names) {
    if (name.size() <= id.size()) {
        length = 0;
        setString(name);
        return;
    }
    length = static_cast<int32_t>(name.size());
    setNumber(static_cast<int32_t>(names.size()));
    names.append(name);
}

namespace {

void putInt32(std::byte* record, size_t offset, int32_t value) {
    std::memcpy(record + offset, &value, sizeof(value));
}

int32_t getInt32(ByteSpan record, size_t offset) {
    int32_t value;
    std::memcpy(&value, record.data() + offset, sizeof(value));
    return value;
}

// The union holds a string padded with NULs; it is not terminated when it
// fills all kUnionSize bytes.
std::string getString(ByteSpan record, size_t offset) {
    auto p = reinterpret_cast<char const*>(record.data() + offset);
    auto end = std::find(p, p + layout::kUnionSize, '\0');
    return std::string(p, end);
}

std::string getName(ByteSpan record, ByteSpan names) {
    auto length = getInt32(record, layout::kLengthOffset);
    if (length == 0) return getString(record, layout::kUnionOffset);
    auto offset = getInt32(record, layout::kUnionOffset);
    if (length < 0 || offset < 0 ||
        static_cast<size_t>(offset) + static_cast<size_t>(length) >
            names.size()) {
        throw ConsistencyFault("event name at offset " +
                               std::to_string(offset) + ", length " +
                               std::to_string(length) +
                               " is outside the name table of " +
                               std::to_string(names.size()) + " bytes");
    }
    auto p = reinterpret_cast<char const*>(names.data() + offset);
    return std::string(p, static_cast<size_t>(length));
}

// The name table starts after the first sentinel of a chunk.
ByteSpan nameTable(ByteSpan chunk) {
    for (size_t pos = 0; pos + layout::kEventSize <= chunk.size();
         pos += layout::kEventSize) {
        if (getInt32(chunk.subspan(pos), layout::kTypeOffset) ==
            layout::kTagListTerminated) {
            return chunk.subspan(pos + layout::kEventSize);
        }
    }
    return {};
}

}  // namespace

void appendRecord(EventRecord const& record, std::vector<std::byte>& out) {
    auto base = out.size();
    out.resize(base + layout::kEventSize);
    auto p = out.data() + base;
    putInt32(p, layout::kTypeOffset, record.type);
    putInt32(p, layout::kUniqueIdentifierOffset, record.uniqueIdentifier);
    putInt32(p, layout::kTextPositionOffset, record.textPosition);
    putInt32(p, layout::kLengthOffset, record.length);
    putInt32(p, layout::kAudioPositionOffset, record.audioPosition);
    putInt32(p, layout::kSampleOffset, record.sample);
    putInt32(p, layout::kUserDataOffset, record.userData);
    std::memcpy(p + layout::kUnionOffset, record.id.data(), record.id.size());
}

void appendNames(std::string_view names, std::vector<std::byte>& out) {
    auto bytes = reinterpret_cast<std::byte const*>(names.data());
    out.insert(out.end(), bytes, bytes + names.size());
}

ByteSpan ByteCursor::take(size_t n) {
    if (n > remaining()) {
        throw ConsistencyFault(
            "truncated event record: need " + std::to_string(n) +
            " bytes, " + std::to_string(remaining()) + " remaining");
    }
    auto piece = bytes.subspan(position, n);
    position += n;
    return piece;
}

std::optional<SynthEvent> decodeRecord(ByteSpan record, ByteSpan names) {
    if (record.size() < layout::kEventSize) {
        throw ConsistencyFault("event record shorter than " +
                               std::to_string(layout::kEventSize) + " bytes");
    }
    auto tag = getInt32(record, layout::kTypeOffset);
    if (tag == layout::kTagListTerminated || tag == layout::kTagSampleRate) {
        return std::nullopt;
    }
    if (tag < static_cast<int32_t>(SynthEventType::Word) ||
        tag > static_cast<int32_t>(SynthEventType::Phoneme)) {
        throw ConsistencyFault("unknown event type tag " +
                               std::to_string(tag));
    }

    SynthEvent event;
    event.textPosition = getInt32(record, layout::kTextPositionOffset);
    event.audioPosition =
        AudioPositionUnit(getInt32(record, layout::kAudioPositionOffset));

    switch (static_cast<SynthEventType>(tag)) {
        case SynthEventType::Word:
            event.payload =
                WordEvent{.number = getInt32(record, layout::kUnionOffset),
                          .length = getInt32(record, layout::kLengthOffset)};
            break;
        case SynthEventType::Sentence:
            event.payload = SentenceEvent{
                .number = getInt32(record, layout::kUnionOffset)};
            break;
        case SynthEventType::Mark:
            event.payload =
                MarkEvent{.name = getName(record, names)};
            break;
        case SynthEventType::Play:
            event.payload =
                PlayEvent{.name = getName(record, names)};
            break;
        case SynthEventType::End:
            event.payload = EndEvent{};
            break;
        case SynthEventType::MsgTerminated:
            event.payload = MsgTerminatedEvent{};
            break;
        case SynthEventType::Phoneme:
            event.payload = PhonemeEvent{
                .phoneme = getString(record, layout::kUnionOffset)};
            break;
    }
    return event;
}

size_t EventDecoder::feed(ByteSpan chunk, SynthEventList& out) {
    if (state_ == State::Idle) state_ = State::Streaming;

    size_t count = 0;
    auto names = nameTable(chunk);
    auto cursor = ByteCursor(chunk);
    while (not cursor.empty()) {
        auto record = cursor.take(layout::kEventSize);
        if (getInt32(record, layout::kTypeOffset) ==
            layout::kTagListTerminated) {
            break;
        }
        if (state_ == State::Terminated) {
            throw Error(kErrorEventAfterTermination,
                        "event record received after the message was "
                        "terminated");
        }
        auto event = decodeRecord(record, names);
        if (not event) continue;
        if (event->type() == SynthEventType::MsgTerminated) {
            state_ = State::Terminated;
        }
        out.push_back(std::move(*event));
        ++count;
    }
    return count;
}

}  // namespace speak
