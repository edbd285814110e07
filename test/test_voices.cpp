#include "voices.h"

#include <espeak-ng/espeak_ng.h>

#include <memory>

#include "catch2/catch.hpp"
#include "error.h"
#include "espeak_engine.h"
#include "fake_engine.h"

namespace speak {

TEST_CASE("voice catalog", "[unit]") {
    auto fake = std::make_shared<FakeEngine>();
    auto shared = SharedEngine(fake);

    SECTION("lists the engine's voices in engine order") {
        auto voices = listVoices(shared);
        REQUIRE(voices.size() == 2);
        CHECK(voices[0].name == "English (America)");
        CHECK(voices[0].languages.size() == 2);
        CHECK(voices[0].languages[0].priority == 2);
        CHECK(voices[0].languages[0].name == "en-us");
        CHECK(voices[1].gender == Gender::Female);
        CHECK(voices[1].age == 30);
    }

    SECTION("returned lists are not shared") {
        auto voices = listVoices(shared);
        voices[0].name = "changed";
        voices.pop_back();
        auto again = listVoices(shared);
        REQUIRE(again.size() == 2);
        CHECK(again[0].name == "English (America)");
    }

    SECTION("not cached") {
        listVoices(shared);
        fake->voices.pop_back();
        CHECK(listVoices(shared).size() == 1);
    }

    SECTION("validation") {
        CHECK_NOTHROW(validateVoice(shared, VoiceQuery{.name = "German"}));
        CHECK_NOTHROW(validateVoice(shared, VoiceQuery{}));
        CHECK_THROWS_AS(
            validateVoice(shared, VoiceQuery{.name = "does-not-exist"}),
            Error);
        CHECK_THROWS_AS(validateVoice(shared, VoiceQuery{.language = "de",
                                                         .gender =
                                                             Gender::Male}),
                        Error);
    }
}

TEST_CASE("packed language lists", "[unit]") {
    SECTION("several languages") {
        // As espeak-ng stores them: priority byte, name, NUL, ..., 0.
        char const packed[] = "\x02" "en-us\0" "\x05" "en\0";
        auto languages = parseLanguages(packed);
        REQUIRE(languages.size() == 2);
        CHECK(languages[0].priority == 2);
        CHECK(languages[0].name == "en-us");
        CHECK(languages[1].priority == 5);
        CHECK(languages[1].name == "en");
    }

    SECTION("empty") {
        CHECK(parseLanguages("").empty());
        CHECK(parseLanguages(nullptr).empty());
    }
}

}  // namespace speak
