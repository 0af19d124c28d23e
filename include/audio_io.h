#pragma once

#include "audio_device.h"
#include <string>
#include <memory>

namespace calcvox {

/**
 * @brief PortAudio-backed device factory
 *
 * Input: mono float32 stream at audio.input_sample_rate delivering
 * audio.capture_frame_samples per callback into a bounded queue (oldest
 * frame dropped when the event loop falls behind).
 *
 * Output: mono float32 stream at audio.output_sample_rate. The callback
 * mixes scheduled voices against its own frame counter, which is the
 * device clock reported by current_time().
 *
 * Each open stream holds its own Pa_Initialize() reference, so input and
 * output can be closed independently in any order.
 */
class PortAudioDeviceFactory : public AudioDeviceFactory {
public:
    Result<std::unique_ptr<AudioInput>> open_input(const AudioConfig& config) override;
    Result<std::unique_ptr<AudioOutput>> open_output(const AudioConfig& config) override;

    /**
     * @brief List all available audio devices through the logger
     */
    static void list_devices();
};

} // namespace calcvox
