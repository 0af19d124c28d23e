#include "frequency_analyser.h"
#include <algorithm>
#include <cmath>

namespace calcvox {

namespace {

constexpr float PI = 3.14159265358979323846f;
constexpr float SMOOTHING = 0.8f;
constexpr float MIN_DB = -100.0f;
constexpr float MAX_DB = -30.0f;

} // namespace

FrequencyAnalyser::FrequencyAnalyser() : write_pos_(0), skipped_frames_(0) {
    const float n = static_cast<float>(ANALYSER_FFT_SIZE);
    for (int i = 0; i < ANALYSER_FFT_SIZE; ++i) {
        float x = static_cast<float>(i) / n;
        window_[i] = 0.42f - 0.5f * std::cos(2.0f * PI * x) + 0.08f * std::cos(4.0f * PI * x);
    }
    ring_.fill(0.0f);
    smoothed_.fill(0.0f);
}

void FrequencyAnalyser::push(const FloatFrame& frame) {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        skipped_frames_++;
        return;
    }
    // Only the tail of a large frame matters for the window
    size_t start = frame.size() > ring_.size() ? frame.size() - ring_.size() : 0;
    for (size_t i = start; i < frame.size(); ++i) {
        ring_[write_pos_] = frame[i];
        write_pos_ = (write_pos_ + 1) % ring_.size();
    }
}

std::vector<uint8_t> FrequencyAnalyser::byte_frequency_data() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::array<float, ANALYSER_FFT_SIZE> windowed;
    for (size_t i = 0; i < ring_.size(); ++i) {
        // Oldest sample first
        windowed[i] = ring_[(write_pos_ + i) % ring_.size()] * window_[i];
    }

    std::vector<uint8_t> out(ANALYSER_BIN_COUNT);
    const float n = static_cast<float>(ANALYSER_FFT_SIZE);
    for (int k = 0; k < ANALYSER_BIN_COUNT; ++k) {
        float re = 0.0f;
        float im = 0.0f;
        for (int t = 0; t < ANALYSER_FFT_SIZE; ++t) {
            float phase = 2.0f * PI * static_cast<float>(k) * static_cast<float>(t) / n;
            re += windowed[t] * std::cos(phase);
            im -= windowed[t] * std::sin(phase);
        }
        float magnitude = std::sqrt(re * re + im * im) / n;
        smoothed_[k] = SMOOTHING * smoothed_[k] + (1.0f - SMOOTHING) * magnitude;

        float db = smoothed_[k] > 0.0f ? 20.0f * std::log10(smoothed_[k]) : MIN_DB;
        float scaled = 255.0f * (db - MIN_DB) / (MAX_DB - MIN_DB);
        out[k] = static_cast<uint8_t>(std::max(0.0f, std::min(255.0f, scaled)));
    }
    return out;
}

float FrequencyAnalyser::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    float sum_sq = 0.0f;
    for (float s : ring_) {
        sum_sq += s * s;
    }
    return std::sqrt(sum_sq / static_cast<float>(ring_.size()));
}

void FrequencyAnalyser::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_.fill(0.0f);
    smoothed_.fill(0.0f);
    write_pos_ = 0;
    skipped_frames_ = 0;
}

} // namespace calcvox
