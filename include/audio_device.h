#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace calcvox {

/**
 * @brief Microphone capture stream
 *
 * The device's own callback thread only queues frames; read_frame() is
 * called from the event loop to drain them.
 */
class AudioInput {
public:
    virtual ~AudioInput() = default;

    /**
     * @brief Pop the oldest captured frame
     * @return False when no frame is queued (non-blocking)
     */
    virtual bool read_frame(FloatFrame& frame) = 0;

    /// Stop delivering frames (microphone released). Idempotent.
    virtual void stop_tracks() = 0;

    /// Release the device context. Idempotent; implies stop_tracks().
    virtual void close() = 0;

    virtual int sample_rate() const = 0;
};

using PlaybackVoiceId = uint64_t;

/**
 * @brief Speaker output with an absolute device clock
 *
 * Buffers are scheduled at a start time (seconds on current_time()'s clock)
 * and reported back through on_ended once fully played. Completion callbacks
 * are only ever invoked from dispatch_completions(), on the event loop.
 */
class AudioOutput {
public:
    using EndedCallback = std::function<void()>;

    virtual ~AudioOutput() = default;

    /// Seconds of audio the device has rendered since open
    virtual double current_time() const = 0;

    virtual int sample_rate() const = 0;

    /**
     * @brief Schedule a mono buffer to start at an absolute device time
     * @return Voice id for stop(), or an error when the device is closed
     */
    virtual Result<PlaybackVoiceId> schedule(FloatBuffer samples, double start_at,
                                             EndedCallback on_ended) = 0;

    /// Stop a voice now; no ended callback is delivered for it. Unknown ids are ignored.
    virtual void stop(PlaybackVoiceId voice) = 0;

    /// Fire ended callbacks for voices that finished since the last call
    virtual void dispatch_completions() = 0;

    /// Release the device context. Idempotent; pending voices are dropped silently.
    virtual void close() = 0;
};

/**
 * @brief Acquires input/output devices for one session
 */
class AudioDeviceFactory {
public:
    virtual ~AudioDeviceFactory() = default;

    /// @return Open capture stream, or DeviceAcquisitionFailure
    virtual Result<std::unique_ptr<AudioInput>> open_input(const AudioConfig& config) = 0;

    /// @return Open playback stream, or DeviceAcquisitionFailure
    virtual Result<std::unique_ptr<AudioOutput>> open_output(const AudioConfig& config) = 0;
};

} // namespace calcvox
