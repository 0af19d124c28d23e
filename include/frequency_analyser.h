#pragma once

#include "common.h"
#include <array>
#include <cstdint>
#include <mutex>
#include <vector>

namespace calcvox {

/**
 * @brief Read-only analysis tap on the capture stream (visualization only)
 *
 * Keeps the most recent ANALYSER_FFT_SIZE samples and produces byte
 * frequency magnitudes the way a browser AnalyserNode does: Blackman
 * window, temporal smoothing 0.8, -100..-30 dB mapped to 0..255.
 *
 * push() never blocks: when a reader holds the lock the frame is skipped.
 */
class FrequencyAnalyser {
public:
    FrequencyAnalyser();

    /// Capture side; non-blocking
    void push(const FloatFrame& frame);

    /**
     * @brief Magnitudes for ANALYSER_BIN_COUNT bins, 0..255
     */
    std::vector<uint8_t> byte_frequency_data();

    /// RMS of the most recent window, 0..1
    float level();

    /// Forget history (new session)
    void reset();

    /// Frames dropped because a reader held the lock
    size_t skipped_frames() const { return skipped_frames_; }

private:
    std::mutex mutex_;
    std::array<float, ANALYSER_FFT_SIZE> window_;
    std::array<float, ANALYSER_FFT_SIZE> ring_;
    std::array<float, ANALYSER_BIN_COUNT> smoothed_;
    size_t write_pos_;
    size_t skipped_frames_;
};

} // namespace calcvox
