#pragma once

#include "audio_device.h"
#include "config.h"
#include "display_model.h"
#include "errors.h"
#include "frequency_analyser.h"
#include "state_machine.h"
#include "transport/transport_session.h"
#include <memory>

namespace calcvox {

class TranscriptionAccumulator;
class PlaybackScheduler;
class ToolRegistry;

/**
 * @brief Voice session lifecycle controller
 *
 * Owns the connection state machine and every per-session resource (input
 * and output devices, the transport session) and routes inbound session
 * events to the transcription accumulator, the tool dispatcher and the
 * playback scheduler.
 *
 * Every exit path (stop, remote close, failure) runs the same teardown:
 * input tracks stopped, input closed, output closed, session closed,
 * playback cut, state Disconnected, transcription buffer cleared.
 *
 * Single-threaded: every method must be called from the event loop thread,
 * and poll() must be called once per loop iteration.
 */
class SessionController {
public:
    SessionController(const Config& config,
                      AudioDeviceFactory& devices,
                      transport::TransportConnector& connector,
                      DisplayModel& display);

    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Start a session
     *
     * No-op unless Disconnected. Resolves the credential, acquires both
     * devices and starts opening the transport; the state stays Connecting
     * until the agent acknowledges the setup.
     * @return Error (already torn down, state back to Disconnected) when the
     *         attempt failed before the transport was asked to open
     */
    VoidResult connect();

    /// Tear everything down. Idempotent, safe in any state, never throws.
    void stop();

    /// Stop when Connected or Connecting, connect otherwise
    void toggle_connection();

    /// Clear display, history and transcription without touching the session
    void manual_reset();

    /// Pump transport, capture and playback completions
    void poll();

    ConnectionState state() const;

    /// Most recent failure (ErrorType::None after a clean connect)
    const Error& last_error() const;

    /// Live analysis tap, nullptr while no input device is held
    FrequencyAnalyser* analyser();

    const TranscriptionAccumulator& accumulator() const;
    const PlaybackScheduler& scheduler() const;
    const ToolRegistry& tools() const;

    /// Identifier of the current connect attempt (bumped on every connect and teardown)
    uint64_t attempt_id() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace calcvox
