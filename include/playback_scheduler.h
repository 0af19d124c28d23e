#pragma once

#include "audio_device.h"
#include "playback_handles.h"
#include "transport/transport_session.h"
#include "errors.h"

namespace calcvox {

/**
 * @brief Gapless playback of the agent's synthesized speech
 *
 * Each decoded fragment starts at max(next_start_time, device time), so
 * fragments play back to back and never in the past; the cursor then
 * advances by exactly the fragment duration. Finished voices leave the
 * active set through their ended callback.
 *
 * Event loop only.
 */
class PlaybackScheduler {
public:
    PlaybackScheduler();
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    /// Output device for the current session (not owned)
    void attach(AudioOutput* output);

    /// Forget the device; call after hard_stop()
    void detach();

    /**
     * @brief Decode one fragment and schedule it
     * @return DecodeFailure (fragment dropped, timeline untouched), or an
     *         error when no device is attached or scheduling failed
     */
    VoidResult enqueue(const transport::AudioChunk& chunk);

    /// Stop every active voice, clear the set, rewind the timeline to 0
    void hard_stop();

    /// Seconds on the device clock where the next fragment may start
    double next_start_time() const { return next_start_time_; }

    const PlaybackHandleSet& active() const { return active_; }
    size_t active_count() const { return active_.size(); }

    /// Fragments dropped because they could not be decoded
    size_t dropped_fragments() const { return dropped_fragments_; }

private:
    void on_voice_ended(PlaybackHandle handle);

    AudioOutput* output_;
    PlaybackHandleSet active_;
    double next_start_time_;
    size_t dropped_fragments_;
};

} // namespace calcvox
