#include "session_controller.h"
#include "capture_pipeline.h"
#include "logger.h"
#include "playback_scheduler.h"
#include "tool_dispatcher.h"
#include "tool_registry.h"
#include "tools/calculator_tools.h"
#include "transcription_accumulator.h"
#include <vector>

namespace calcvox {

class SessionController::Impl {
public:
    Impl(const Config& config, AudioDeviceFactory& devices,
         transport::TransportConnector& connector, DisplayModel& display)
        : config_(config),
          devices_(devices),
          connector_(connector),
          display_(display),
          accumulator_(display),
          dispatcher_(registry_),
          capture_(state_, analyser_),
          analyser_active_(false),
          attempt_(0) {
        registry_.register_tool(std::make_shared<DisplayResultTool>(display_, accumulator_));
        registry_.register_tool(std::make_shared<ResetAppTool>(display_, accumulator_));

        state_.set_listener([this](ConnectionState previous, ConnectionState current) {
            LOG_SESSION(std::string(to_string(previous)) + " -> " + to_string(current));
            display_.set_connection_state(current);
        });
    }

    ~Impl() {
        stop();
        retired_sessions_.clear();
    }

    VoidResult connect() {
        if (!state_.on_connect_requested()) {
            Logger::debug(std::string("[Session] connect() ignored in state ") + to_string(state_.get_state()));
            return {};
        }
        ++attempt_;
        last_error_ = Error();
        LOG_SESSION("Connect attempt " + std::to_string(attempt_));

        auto api_key = resolve_api_key(config_.session);
        if (!api_key) {
            return fail(api_key.error());
        }

        auto input = devices_.open_input(config_.audio);
        if (!input) {
            return fail(input.error());
        }
        input_ = std::move(input.value());

        auto output = devices_.open_output(config_.audio);
        if (!output) {
            return fail(output.error());
        }
        output_ = std::move(output.value());

        analyser_.reset();
        analyser_active_ = true;
        capture_.attach(input_.get());
        scheduler_.attach(output_.get());

        transport::SessionSetup setup;
        setup.model = config_.session.model;
        setup.system_instruction = config_.session.system_instruction;
        setup.function_declarations_json = registry_.get_function_declarations_json();
        setup.input_transcription = true;

        uint64_t attempt = attempt_;
        auto session = connector_.open(setup, api_key.value(),
            [this, attempt](const transport::InboundMessage& message) {
                on_inbound(attempt, message);
            });
        if (!session) {
            return fail(session.error());
        }
        session_ = std::move(session.value());
        return {};
    }

    void stop() {
        bool idle = state_.get_state() == ConnectionState::Disconnected &&
                    !session_ && !input_ && !output_;
        if (idle) {
            return;
        }
        LOG_SESSION("Stopping session");
        teardown();
    }

    void toggle_connection() {
        ConnectionState state = state_.get_state();
        if (state == ConnectionState::Connected || state == ConnectionState::Connecting) {
            stop();
            return;
        }
        auto connected = connect();
        if (!connected) {
            Logger::warn("[Session] Connect failed: " + connected.error().to_string());
        }
    }

    void manual_reset() {
        accumulator_.reset();
        display_.reset();
    }

    void poll() {
        // Sessions retired in an earlier iteration are no longer on the stack
        retired_sessions_.clear();

        if (session_) {
            session_->poll();
        }
        capture_.pump(session_.get());
        if (output_) {
            output_->dispatch_completions();
        }
    }

    ConnectionState state() const { return state_.get_state(); }
    const Error& last_error() const { return last_error_; }
    FrequencyAnalyser* analyser() { return analyser_active_ ? &analyser_ : nullptr; }
    const TranscriptionAccumulator& accumulator() const { return accumulator_; }
    const PlaybackScheduler& scheduler() const { return scheduler_; }
    const ToolRegistry& tools() const { return registry_; }
    uint64_t attempt_id() const { return attempt_; }

private:
    Error fail(const Error& error) {
        last_error_ = error;
        Logger::error("[Session] " + error.to_string());
        state_.on_failure();
        teardown();
        return error;
    }

    void on_inbound(uint64_t attempt, const transport::InboundMessage& message) {
        if (attempt != attempt_ || !session_) {
            Logger::debug(std::string("[Session] Ignoring stale ") + transport::to_string(message.kind) +
                          " from attempt " + std::to_string(attempt));
            return;
        }

        switch (message.kind) {
            case transport::InboundKind::SessionOpened:
                if (state_.on_remote_open()) {
                    LOG_SESSION("Live session open");
                }
                break;

            case transport::InboundKind::TranscriptionFragment:
                accumulator_.append_fragment(message.text);
                break;

            case transport::InboundKind::ToolCallBatch: {
                auto acked = dispatcher_.dispatch(message.tool_calls, *session_);
                if (!acked) {
                    Logger::debug("[Session] Tool acknowledgement lost; waiting for transport status");
                }
                break;
            }

            case transport::InboundKind::AudioChunk: {
                auto queued = scheduler_.enqueue(message.audio);
                if (!queued) {
                    LOG_PLAYBACK("Fragment not played (" + std::string(error_type_name(queued.error().type)) + ")");
                }
                break;
            }

            case transport::InboundKind::SessionClosed:
                LOG_SESSION("Remote closed the session: " + message.text);
                teardown();
                break;

            case transport::InboundKind::SessionError:
                fail(message.error);
                break;
        }
    }

    /// Release everything in a fixed order; a step that throws is logged and the next one still runs
    void teardown() {
        if (input_) {
            release_step("stop input tracks", [this]() { input_->stop_tracks(); });
            release_step("close input", [this]() { input_->close(); });
        }
        capture_.detach();
        analyser_active_ = false;
        analyser_.reset();

        if (output_) {
            release_step("close output", [this]() { output_->close(); });
        }

        if (session_) {
            release_step("close session", [this]() {
                auto closed = session_->close();
                if (!closed) {
                    Logger::warn("[Session] Close failed: " + closed.error().message);
                }
            });
            // Destroyed on the next poll(); we may be inside its receive loop
            retired_sessions_.push_back(std::move(session_));
        }

        release_step("stop playback", [this]() { scheduler_.hard_stop(); });
        scheduler_.detach();

        input_.reset();
        output_.reset();
        ++attempt_;

        state_.on_teardown_complete();
        accumulator_.clear();
    }

    template <typename Step>
    void release_step(const char* name, Step&& step) {
        try {
            step();
        } catch (const std::exception& e) {
            Logger::error(std::string("[Session] Teardown step '") + name + "' failed: " + e.what());
        }
    }

    Config config_;
    AudioDeviceFactory& devices_;
    transport::TransportConnector& connector_;
    DisplayModel& display_;

    ConnectionStateMachine state_;
    FrequencyAnalyser analyser_;
    TranscriptionAccumulator accumulator_;
    ToolRegistry registry_;
    ToolDispatcher dispatcher_;
    CapturePipeline capture_;
    PlaybackScheduler scheduler_;
    bool analyser_active_;

    std::unique_ptr<AudioInput> input_;
    std::unique_ptr<AudioOutput> output_;
    std::unique_ptr<transport::TransportSession> session_;
    std::vector<std::unique_ptr<transport::TransportSession>> retired_sessions_;

    uint64_t attempt_;
    Error last_error_;
};

SessionController::SessionController(const Config& config,
                                     AudioDeviceFactory& devices,
                                     transport::TransportConnector& connector,
                                     DisplayModel& display)
    : pimpl_(std::make_unique<Impl>(config, devices, connector, display)) {
}

SessionController::~SessionController() = default;

VoidResult SessionController::connect() {
    return pimpl_->connect();
}

void SessionController::stop() {
    pimpl_->stop();
}

void SessionController::toggle_connection() {
    pimpl_->toggle_connection();
}

void SessionController::manual_reset() {
    pimpl_->manual_reset();
}

void SessionController::poll() {
    pimpl_->poll();
}

ConnectionState SessionController::state() const {
    return pimpl_->state();
}

const Error& SessionController::last_error() const {
    return pimpl_->last_error();
}

FrequencyAnalyser* SessionController::analyser() {
    return pimpl_->analyser();
}

const TranscriptionAccumulator& SessionController::accumulator() const {
    return pimpl_->accumulator();
}

const PlaybackScheduler& SessionController::scheduler() const {
    return pimpl_->scheduler();
}

const ToolRegistry& SessionController::tools() const {
    return pimpl_->tools();
}

uint64_t SessionController::attempt_id() const {
    return pimpl_->attempt_id();
}

} // namespace calcvox
