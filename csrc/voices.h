#pragma once

#include "engine.h"
#include "shared_engine.h"
#include "types.h"

namespace speak {

// Voices currently known to the engine, in the order the engine reports
// them. Not cached; the returned list is a fresh copy the caller may modify.
VoiceList listVoices(SharedEngine& engine);
VoiceList listVoices();

// Throws Error if no voice of the engine matches query.
void validateVoice(SharedEngine& engine, VoiceQuery const& query);

}  // namespace speak
