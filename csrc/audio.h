#pragma once
#include <soxr.h>

#include "types.h"

namespace speak {

// Copy PCM samples into an IntTensor [nSample, 1].
Tensor samplesToWave(Samples const& samples);

// Resample an audio from inRate to outRate.
// waveforms in shape [nSample, nChannel], int32.
// Returns the resampled audio, same layout.
// Implemented with soxr, precision 16 is soxr's high quality preset.
Tensor resample(Tensor inWave, double inRate, double outRate,
                double precision = 16);

// Resample mono PCM samples from inRate to outRate.
Samples resample(Samples const& in, double inRate, double outRate,
                 double precision = 16);

}  // namespace speak
