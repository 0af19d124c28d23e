#pragma once

#include "audio_device.h"
#include "frequency_analyser.h"
#include "state_machine.h"
#include "transport/transport_session.h"

namespace calcvox {

/**
 * @brief Microphone -> agent streaming
 *
 * pump() drains every frame the input callback queued since the last
 * iteration. Each frame goes to the analysis tap first; while the session
 * is Connected it is then encoded (int16 LE, base64) and sent as one
 * realtime audio message. Frames read before the session opens are only
 * analysed.
 *
 * There is no backpressure: a failed send drops the frame (logged, rate
 * limited).
 */
class CapturePipeline {
public:
    CapturePipeline(const ConnectionStateMachine& state, FrequencyAnalyser& analyser);

    /// Input device for the current session (not owned)
    void attach(AudioInput* input);
    void detach();

    /**
     * @brief Drain queued frames
     * @param session Open session, or nullptr while none exists
     * @return Number of frames sent
     */
    size_t pump(transport::TransportSession* session);

    size_t frames_sent() const { return frames_sent_; }
    size_t send_failures() const { return send_failures_; }

private:
    void report_send_failure(const Error& error);

    const ConnectionStateMachine& state_;
    FrequencyAnalyser& analyser_;
    AudioInput* input_;
    FloatFrame frame_;
    size_t frames_sent_;
    size_t send_failures_;
    size_t failures_since_log_;
    TimePoint last_failure_log_;
};

} // namespace calcvox
