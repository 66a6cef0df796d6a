#pragma once

#include "configuration.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace whispertrigger {

// One finalized recording on its way to the model. Owned by exactly one
// queue entry; the audio itself is shared so it can be replayed.
struct TranscriptionRequest {
    uint64_t id = 0;
    std::shared_ptr<const std::vector<float>> audio;  // 16 kHz mono
    std::string language;
    std::string processing_mode;
    bool replay = false;
};

struct TranscriptionResult {
    uint64_t request_id = 0;
    std::string raw_text;
    std::string language;
    std::string processing_mode;
    ComputeDevice device = ComputeDevice::Cpu;
};

} // namespace whispertrigger
