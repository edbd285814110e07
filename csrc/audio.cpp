#include "audio.h"

#include <soxr.h>
#include <torch/types.h>

#include <stdexcept>
#include <string>

namespace speak {

namespace {

size_t outputLength(size_t inLength, double inRate, double outRate) {
    if (inRate <= 0 || outRate <= 0) {
        throw std::invalid_argument("resample: rates must be positive");
    }
    return static_cast<size_t>(inLength * outRate / inRate + .5);
}

// There are a lot of specifications here, you may want to tune them.
// Typically precision = 16, the higher the better.
void oneshot(double inRate, double outRate, unsigned channels,
             soxr_datatype_t type, void const* in, size_t inLength,
             void* out, size_t outLength, double precision) {
    soxr_io_spec_t const io_spec{.itype = type, .otype = type, .scale = 1.0};

    soxr_quality_spec_t const quality_spec{.precision = precision,
                                           .phase_response = 50,
                                           .passband_end = 0.95,
                                           .stopband_begin = 1.0};

    size_t done = 0;
    soxr_error_t error =
        soxr_oneshot(inRate, outRate, channels, in, inLength, nullptr, out,
                     outLength, &done, &io_spec, &quality_spec, nullptr);
    if (error != nullptr) {
        throw std::runtime_error("soxr_oneshot failed: " + std::string(error));
    }
}

}  // namespace

// wave (IntTensor): [nSample, 1].
Tensor samplesToWave(Samples const& samples) {
    Tensor wave =
        torch::empty({static_cast<int64_t>(samples.size()), 1}, torch::kInt32);
    auto p = wave.data_ptr<int32_t>();
    for (size_t i = 0; i < samples.size(); ++i) p[i] = samples[i];
    return wave;
}

Tensor resample(Tensor inWave, double inRate, double outRate,
                double precision) {
    inWave = inWave.to(torch::kInt32).contiguous();
    unsigned channels = inWave.size(1);
    size_t in_length = inWave.size(0);
    size_t out_length = outputLength(in_length, inRate, outRate);
    Tensor out_wave = torch::zeros(
        {static_cast<int64_t>(out_length), static_cast<int64_t>(channels)},
        torch::kInt32);
    if (in_length == 0) return out_wave;

    oneshot(inRate, outRate, channels, SOXR_INT32_I,
            inWave.data_ptr<int32_t>(), in_length,
            out_wave.data_ptr<int32_t>(), out_length, precision);
    return out_wave;
}

Samples resample(Samples const& in, double inRate, double outRate,
                 double precision) {
    Samples out(outputLength(in.size(), inRate, outRate));
    if (in.empty()) return out;
    oneshot(inRate, outRate, 1, SOXR_INT16_I, in.data(), in.size(),
            out.data(), out.size(), precision);
    return out;
}

}  // namespace speak
