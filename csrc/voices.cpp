#include "voices.h"

#include "log.h"

namespace speak {

VoiceList listVoices(SharedEngine& engine) {
    auto lease = engine.acquire();
    auto voices = lease->listVoices();
    logger()->debug("engine reports {} voices", voices.size());
    return voices;
}

VoiceList listVoices() { return listVoices(*SharedEngine::global()); }

void validateVoice(SharedEngine& engine, VoiceQuery const& query) {
    auto lease = engine.acquire();
    lease->setVoice(query);
}

}  // namespace speak
