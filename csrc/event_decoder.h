#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "events.h"
#include "types.h"

namespace speak {

// Binary layout of one event record, as emitted by the engine binding.
// All fields are 32-bit integers in host byte order, followed by an 8 byte
// union whose interpretation depends on the type tag.
//
// A chunk is a run of records ended by the list-terminated sentinel. Mark
// and Play names longer than the union follow the sentinel in a name table:
// such a record has a non-zero length field, and its union holds the
// offset of the name in the table.
namespace layout {
constexpr inline size_t kEventSize = 0x24;
constexpr inline size_t kTypeOffset = 0x00;
constexpr inline size_t kUniqueIdentifierOffset = 0x04;
constexpr inline size_t kTextPositionOffset = 0x08;
constexpr inline size_t kLengthOffset = 0x0c;
constexpr inline size_t kAudioPositionOffset = 0x10;
constexpr inline size_t kSampleOffset = 0x14;
constexpr inline size_t kUserDataOffset = 0x18;
constexpr inline size_t kUnionOffset = 0x1c;  // number, name or phoneme
constexpr inline size_t kUnionSize = kEventSize - kUnionOffset;

constexpr inline int32_t kTagListTerminated = 0;
constexpr inline int32_t kTagSampleRate = 8;
}  // namespace layout

// Engine time unit of the audio position field.
using AudioPositionUnit = std::chrono::milliseconds;

// Unpacked form of a record, used by the engine binding to produce bytes.
struct EventRecord {
    int32_t type{layout::kTagListTerminated};
    int32_t uniqueIdentifier{};
    int32_t textPosition{};
    int32_t length{};
    int32_t audioPosition{};
    int32_t sample{};
    int32_t userData{};
    std::array<char, layout::kUnionSize> id{};

    void setNumber(int32_t number);
    // Copies at most kUnionSize bytes. Returns false if s was truncated.
    bool setString(std::string_view s);
    // Store a Mark or Play name. A name that fits the union is embedded;
    // a longer one is appended to names and referenced by offset.
    void setName(std::string_view name, std::string& names);
};

// Serialize a record and append it to out.
void appendRecord(EventRecord const& record, std::vector<std::byte>& out);

// Append the name table of a chunk, after its sentinel.
void appendNames(std::string_view names, std::vector<std::byte>& out);

// Reads fixed-size pieces from a byte buffer.
struct ByteCursor {
    ByteSpan bytes{};
    size_t position{0};

    explicit ByteCursor(ByteSpan bytes) : bytes{bytes} {}

    size_t remaining() const { return bytes.size() - position; }
    bool empty() const { return remaining() == 0; }

    // Take the next n bytes. Throws ConsistencyFault if fewer remain.
    ByteSpan take(size_t n);
};

// Decodes the raw event stream of one synthesis call.
//
// Idle -> Streaming (any number of chunks) -> Terminated (MsgTerminated).
// A chunk is consumed record by record until the list-terminated sentinel;
// a later chunk of the same call continues where the previous one stopped.
struct EventDecoder {
    enum class State { Idle, Streaming, Terminated };

    // Decode the records of one chunk and append them to out. Returns the
    // number of events appended.
    //
    // Throws ConsistencyFault on a truncated record, an unknown type tag or
    // a dangling name reference, and Error(kErrorEventAfterTermination) on a record after the message
    // was terminated.
    size_t feed(ByteSpan chunk, SynthEventList& out);

    State state() const { return state_; }
    void reset() { state_ = State::Idle; }

   private:
    State state_{State::Idle};
};

// Decode a single record, resolving long names against the name table of
// its chunk. Returns the event, or std::nullopt for records that carry no
// speech data (sentinel and sample rate).
//
// Throws ConsistencyFault if a name reference falls outside names.
std::optional<SynthEvent> decodeRecord(ByteSpan record, ByteSpan names = {});

}  // namespace speak
