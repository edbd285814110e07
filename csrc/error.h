#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace speak {

// Raised by the decoder when an event record arrives after the end of the
// message. Lives outside the espeak-ng status range (0x1000xxFF).
constexpr inline uint32_t kErrorEventAfterTermination = 0x2000'01FF;

// A failure reported by the speech engine. Always recoverable: the engine
// and every other Context stay usable.
struct Error : std::runtime_error {
    uint32_t code{};        // espeak-ng status code.
    std::string message{};  // Message intended to be read by humans.

    Error(uint32_t code, std::string message);
};

// The engine violated the event record contract. Aborts the current
// synthesis call only.
struct ConsistencyFault : std::logic_error {
    explicit ConsistencyFault(std::string const& what);
};

// Human readable message of an espeak-ng status code.
std::string statusMessage(uint32_t status);

// Throws an Error carrying the message of status unless it is ENS_OK.
// context names the failing engine call in the log.
void checkStatus(uint32_t status, std::string_view context);

}  // namespace speak
