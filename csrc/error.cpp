#include "error.h"

#include <espeak-ng/espeak_ng.h>

#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "log.h"

namespace speak {

Error::Error(uint32_t code, std::string message)
    : std::runtime_error{"speakxx: " + message},
      code{code},
      message{std::move(message)} {}

ConsistencyFault::ConsistencyFault(std::string const& what)
    : std::logic_error{"speakxx: " + what} {}

std::string statusMessage(uint32_t status) {
    std::array<char, 512> buffer{};
    espeak_ng_GetStatusCodeMessage(static_cast<espeak_ng_STATUS>(status),
                                   buffer.data(), buffer.size());
    return std::string(buffer.data());
}

void checkStatus(uint32_t status, std::string_view context) {
    if (status == ENS_OK) return;
    auto message = statusMessage(status);
    logger()->debug("{} failed with status {:#x}: {}", context, status,
                    message);
    throw Error(status, std::move(message));
}

}  // namespace speak
