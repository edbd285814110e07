#include "espeak_engine.h"

#include <espeak-ng/speak_lib.h>

#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "catch2/catch.hpp"
#include "error.h"
#include "event_decoder.h"

namespace speak {

namespace {

espeak_EVENT nativeEvent(espeak_EVENT_TYPE type, int position,
                         void* userData = nullptr) {
    espeak_EVENT e{};
    e.type = type;
    e.text_position = position;
    e.user_data = userData;
    return e;
}

espeak_EVENT nativeWord(int position, int length, int number, int audio,
                        void* userData = nullptr) {
    auto e = nativeEvent(espeakEVENT_WORD, position, userData);
    e.length = length;
    e.audio_position = audio;
    e.id.number = number;
    return e;
}

espeak_EVENT nativeNamed(espeak_EVENT_TYPE type, int position,
                         char const* name, void* userData = nullptr) {
    auto e = nativeEvent(type, position, userData);
    e.id.name = name;
    return e;
}

SynthEventList decodeAll(std::vector<std::byte> const& chunk) {
    SynthEventList events;
    EventDecoder decoder;
    decoder.feed(chunk, events);
    return events;
}

}  // namespace

TEST_CASE("native event conversion", "[unit]") {
    std::vector<std::byte> chunk;

    SECTION("records, sentinel and names of one callback") {
        auto phoneme = nativeEvent(espeakEVENT_PHONEME, 6);
        std::memcpy(phoneme.id.string, "h@", 2);
        auto rate = nativeEvent(espeakEVENT_SAMPLERATE, 0);
        rate.id.number = 22050;

        std::vector<espeak_EVENT> native{
            rate,
            nativeWord(1, 5, 1, 0),
            nativeNamed(espeakEVENT_MARK, 7, "paragraph_2"),
            nativeNamed(espeakEVENT_PLAY, 7, "beep"),
            phoneme,
            nativeEvent(espeakEVENT_MSG_TERMINATED, 13),
            nativeEvent(espeakEVENT_LIST_TERMINATED, 0),
        };
        detail::encodeEvents(native.data(), chunk);

        auto names = std::string("paragraph_2");
        REQUIRE(chunk.size() == 7 * layout::kEventSize + names.size());
        CHECK(std::memcmp(chunk.data() + 7 * layout::kEventSize,
                          names.data(), names.size()) == 0);

        auto events = decodeAll(chunk);
        REQUIRE(events.size() == 5);
        CHECK(events[0].type() == SynthEventType::Word);
        CHECK(events[0].length() == 5);
        CHECK(events[0].number() == 1);
        CHECK(events[1].type() == SynthEventType::Mark);
        CHECK(events[1].name() == "paragraph_2");
        CHECK(events[2].type() == SynthEventType::Play);
        CHECK(events[2].name() == "beep");
        CHECK(events[3].phoneme() == "h@");
        CHECK(events[4].type() == SynthEventType::MsgTerminated);
    }

    SECTION("a phoneme filling the whole union") {
        auto phoneme = nativeEvent(espeakEVENT_PHONEME, 1);
        std::memcpy(phoneme.id.string, "abcdefgh", 8);
        std::vector<espeak_EVENT> native{
            phoneme, nativeEvent(espeakEVENT_LIST_TERMINATED, 0)};
        detail::encodeEvents(native.data(), chunk);

        auto events = decodeAll(chunk);
        REQUIRE(events.size() == 1);
        CHECK(events[0].phoneme() == "abcdefgh");
    }

    SECTION("a mark without a name") {
        std::vector<espeak_EVENT> native{
            nativeNamed(espeakEVENT_MARK, 3, nullptr),
            nativeEvent(espeakEVENT_LIST_TERMINATED, 0)};
        detail::encodeEvents(native.data(), chunk);

        auto events = decodeAll(chunk);
        REQUIRE(events.size() == 1);
        CHECK(events[0].name().empty());
    }

    SECTION("an empty event list is a bare sentinel") {
        auto end = nativeEvent(espeakEVENT_LIST_TERMINATED, 0);
        chunk.resize(5);
        detail::encodeEvents(&end, chunk);
        CHECK(chunk.size() == layout::kEventSize);
        CHECK(decodeAll(chunk).empty());
    }
}

TEST_CASE("synthesis callback", "[unit]") {
    std::vector<short> seen;
    SynthEventList events;
    EventDecoder decoder;
    int calls = 0;
    SynthCallback callback = [&](SampleSpan samples, ByteSpan records) {
        ++calls;
        append_span(seen, samples);
        decoder.feed(records, events);
    };
    detail::SynthState state{.callback = &callback};

    std::vector<short> wav{1, 2, 3};

    SECTION("forwards samples and events") {
        std::vector<espeak_EVENT> native{
            nativeWord(1, 5, 1, 0, &state),
            nativeNamed(espeakEVENT_MARK, 7, "a_long_mark_name", &state),
            nativeEvent(espeakEVENT_LIST_TERMINATED, 0, &state)};
        CHECK(detail::synthCallback(wav.data(), 3, native.data()) == 0);
        CHECK(seen == wav);
        REQUIRE(events.size() == 2);
        CHECK(events[1].name() == "a_long_mark_name");

        SECTION("without samples") {
            std::vector<espeak_EVENT> last{
                nativeEvent(espeakEVENT_MSG_TERMINATED, 20, &state),
                nativeEvent(espeakEVENT_LIST_TERMINATED, 0, &state)};
            CHECK(detail::synthCallback(nullptr, 0, last.data()) == 0);
            CHECK(seen.size() == 3);
            CHECK(events.size() == 3);
            CHECK(calls == 2);
        }
    }

    SECTION("stops the engine on foreign calls") {
        CHECK(detail::synthCallback(wav.data(), 3, nullptr) == 1);
        std::vector<espeak_EVENT> foreign{
            nativeEvent(espeakEVENT_LIST_TERMINATED, 0)};
        CHECK(detail::synthCallback(wav.data(), 3, foreign.data()) == 1);
        CHECK(calls == 0);
    }

    SECTION("keeps the exception and stops the engine") {
        std::vector<espeak_EVENT> native{
            nativeEvent(espeakEVENT_MSG_TERMINATED, 1, &state),
            nativeWord(2, 3, 1, 0, &state),
            nativeEvent(espeakEVENT_LIST_TERMINATED, 0, &state)};
        CHECK(detail::synthCallback(wav.data(), 3, native.data()) == 1);
        REQUIRE(state.error);
        CHECK(calls == 1);

        std::vector<espeak_EVENT> next{
            nativeEvent(espeakEVENT_LIST_TERMINATED, 0, &state)};
        CHECK(detail::synthCallback(wav.data(), 3, next.data()) == 1);
        CHECK(calls == 1);

        try {
            std::rethrow_exception(state.error);
            FAIL("expected an Error");
        } catch (Error const& e) {
            CHECK(e.code == kErrorEventAfterTermination);
        }
    }

    SECTION("consistency faults are kept as well") {
        callback = [&](SampleSpan, ByteSpan) {
            throw ConsistencyFault("bad chunk");
        };
        std::vector<espeak_EVENT> native{
            nativeEvent(espeakEVENT_LIST_TERMINATED, 0, &state)};
        CHECK(detail::synthCallback(wav.data(), 3, native.data()) == 1);
        REQUIRE(state.error);
        CHECK_THROWS_AS(std::rethrow_exception(state.error),
                        ConsistencyFault);
    }
}

}  // namespace speak
