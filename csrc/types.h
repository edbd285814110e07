#pragma once

#include <torch/torch.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace speak {

using namespace std::literals;

// Engine Components:
struct Engine;
using EngineHandle = std::shared_ptr<Engine>;
struct SharedEngine;
using SharedEngineHandle = std::shared_ptr<SharedEngine>;

// Data Types
using Tensor = torch::Tensor;
using Sample = int16_t;
using Samples = std::vector<Sample>;
using SampleSpan = std::span<const Sample>;
using ByteSpan = std::span<const std::byte>;

// Streaming callback of a synthesis call. Receives, in emission order, a
// chunk of PCM samples and the raw event records produced with it.
using SynthCallback = std::function<void(SampleSpan, ByteSpan)>;

// Utility Templates
// Append all the elements of a span to a vector.
template <typename ElementType>
inline void append_span(std::vector<ElementType>& v,
                        std::span<const ElementType> s) {
    v.insert(v.end(), s.begin(), s.end());
}

}  // namespace speak
