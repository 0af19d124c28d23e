#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>

namespace calcvox {

// Audio types
using Sample = int16_t;              ///< Wire format sample (16-bit signed PCM)
using FloatFrame = std::vector<float>;
using FloatBuffer = std::vector<float>;
using PcmBuffer = std::vector<Sample>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Wall-clock milliseconds since epoch (history timestamps)
inline int64_t wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Audio format constants
constexpr int INPUT_SAMPLE_RATE = 16000;    // microphone -> agent
constexpr int OUTPUT_SAMPLE_RATE = 24000;   // agent -> speaker
constexpr int AUDIO_CHANNELS = 1;
constexpr int CAPTURE_FRAME_SAMPLES = 4096; // 256 ms @ 16kHz
constexpr int INPUT_QUEUE_MAX_FRAMES = 64;

// Analysis tap
constexpr int ANALYSER_FFT_SIZE = 256;
constexpr int ANALYSER_BIN_COUNT = ANALYSER_FFT_SIZE / 2;

// Calculator state
constexpr size_t HISTORY_LIMIT = 10;
constexpr size_t HISTORY_PREVIEW_COUNT = 3;
constexpr const char* INITIAL_RESULT_TEXT = "音声入力を開始";
constexpr const char* NEUTRAL_RESULT_TEXT = "0";

// Wire mime types
constexpr const char* INPUT_AUDIO_MIME = "audio/pcm;rate=16000";

} // namespace calcvox
