/**
 * Session lifecycle tests against fake devices and a fake transport.
 * Asserts:
 * - connect/open/stop state transitions and the fixed teardown order
 * - teardown is idempotent and honored while an open is pending
 * - failures (credential, device, transport) settle at Disconnected
 * - inbound events are routed to accumulator, tools and playback
 * - capture only streams while Connected
 *
 * Run from build dir: ./test_session
 */

#include "config.h"
#include "display_model.h"
#include "fakes.h"
#include "pcm_codec.h"
#include "playback_scheduler.h"
#include "session_controller.h"
#include "tool_registry.h"
#include "transcription_accumulator.h"
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace calcvox;
using calcvox::testing::EventLog;
using calcvox::testing::FakeConnector;
using calcvox::testing::FakeDeviceFactory;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

void clear_key_env() {
    unsetenv("CALCVOX_API_KEY");
    unsetenv("GEMINI_API_KEY");
    unsetenv("API_KEY");
}

/// Everything one test case needs, wired like main() does
struct Rig {
    Config config;
    EventLog log = testing::make_event_log();
    FakeDeviceFactory devices{log};
    FakeConnector connector{log};
    DisplayModel display;
    std::vector<ConnectionState> states;
    std::unique_ptr<SessionController> controller;

    Rig() {
        config.session.api_key = "test-key";
        display.set_listener([this](DisplayModel::Field field) {
            if (field == DisplayModel::Field::Connection) {
                states.push_back(display.connection_state());
                log->push_back(std::string("state:") + to_string(display.connection_state()));
            }
        });
    }

    void build() {
        controller = std::make_unique<SessionController>(config, devices, connector, display);
    }

    std::shared_ptr<testing::FakeSessionState> session() const { return connector.latest(); }

    void deliver(const transport::InboundMessage& message) {
        session()->inbox.push_back(message);
        controller->poll();
    }

    bool logged(const std::string& event) const {
        for (const auto& e : *log) {
            if (e == event) return true;
        }
        return false;
    }
};

transport::InboundMessage audio_message(size_t samples) {
    transport::AudioChunk chunk;
    chunk.mime_type = "audio/pcm;rate=24000";
    chunk.data = pcm::encode_frame(FloatFrame(samples, 0.0f));
    return transport::InboundMessage::audio_chunk(chunk);
}

} // namespace

int main() {
    clear_key_env();

    // --- Happy path: connect, open, stream, stop ---
    {
        Rig rig;
        rig.devices.pending_frames.push_back(FloatFrame(CAPTURE_FRAME_SAMPLES, 0.25f));
        rig.build();

        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.controller->analyser() == nullptr);

        auto connected = rig.controller->connect();
        ASSERT(connected.is_ok());
        ASSERT(rig.controller->state() == ConnectionState::Connecting);
        ASSERT(rig.display.connection_state() == ConnectionState::Connecting);
        ASSERT(rig.controller->analyser() != nullptr);
        ASSERT(rig.session() != nullptr);
        ASSERT(rig.session()->api_key == "test-key");
        ASSERT(rig.session()->setup.model == rig.config.session.model);
        ASSERT(rig.session()->setup.input_transcription);
        auto declarations = nlohmann::json::parse(rig.session()->setup.function_declarations_json);
        ASSERT(declarations.size() == 2);

        // While Connecting, captured audio is analysed but not sent
        rig.controller->poll();
        ASSERT(rig.session()->sent_audio.empty());
        ASSERT(rig.controller->analyser()->level() > 0.2f);

        rig.deliver(transport::InboundMessage::opened());
        ASSERT(rig.controller->state() == ConnectionState::Connected);

        rig.devices.input->frames.push_back(FloatFrame(CAPTURE_FRAME_SAMPLES, 0.5f));
        rig.devices.input->frames.push_back(FloatFrame(CAPTURE_FRAME_SAMPLES, -0.5f));
        rig.controller->poll();
        ASSERT(rig.session()->sent_audio.size() == 2);
        ASSERT(rig.session()->sent_audio[0].mime_type == INPUT_AUDIO_MIME);
        ASSERT(!rig.session()->sent_audio[0].data.empty());

        // connect() while Connected is a no-op
        uint64_t attempt = rig.controller->attempt_id();
        ASSERT(rig.controller->connect().is_ok());
        ASSERT(rig.controller->attempt_id() == attempt);
        ASSERT(rig.connector.sessions.size() == 1);

        // A second open from the server changes nothing
        rig.deliver(transport::InboundMessage::opened());
        ASSERT(rig.controller->state() == ConnectionState::Connected);

        // Routing: transcription -> accumulator, tool call -> dispatcher + ack
        rig.deliver(transport::InboundMessage::transcription("3たす"));
        rig.deliver(transport::InboundMessage::transcription("5"));
        ASSERT(rig.display.expression() == "3たす5");

        transport::ToolCall call;
        call.id = "fc-1";
        call.name = "displayResult";
        call.arguments = "{\"text\":\"8\"}";
        rig.deliver(transport::InboundMessage::tool_call_batch({call}));
        ASSERT(rig.display.result() == "8");
        ASSERT(rig.display.history().size() == 1);
        ASSERT(rig.display.history().entries().front().expression == "3たす5");
        ASSERT(rig.session()->sent_tool_batches.size() == 1);
        ASSERT(rig.session()->sent_tool_batches[0].size() == 1);
        ASSERT(rig.session()->sent_tool_batches[0][0].id == "fc-1");
        ASSERT(rig.controller->accumulator().is_result_finalized());

        rig.deliver(transport::InboundMessage::transcription("7"));
        ASSERT(rig.display.expression() == "7");

        // Audio -> scheduler
        rig.deliver(audio_message(2400));
        rig.deliver(audio_message(2400));
        ASSERT(rig.controller->scheduler().active_count() == 2);
        ASSERT(rig.devices.output->start_times.size() == 2);
        ASSERT(rig.devices.output->start_times[1] > rig.devices.output->start_times[0]);

        // Malformed audio is dropped, session continues
        transport::AudioChunk bad;
        bad.data = "AA==";
        double cursor = rig.controller->scheduler().next_start_time();
        rig.deliver(transport::InboundMessage::audio_chunk(bad));
        ASSERT(rig.controller->scheduler().next_start_time() == cursor);
        ASSERT(rig.controller->state() == ConnectionState::Connected);

        // Stop: fixed teardown order
        rig.log->clear();
        rig.controller->stop();
        std::vector<std::string> expected = {
            "input.stop_tracks",
            "input.close",
            "output.close",
            "session.close",
            "output.stop",
            "output.stop",
            "state:Disconnected",
        };
        ASSERT(*rig.log == expected);
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.controller->scheduler().active_count() == 0);
        ASSERT(rig.controller->scheduler().next_start_time() == 0.0);
        ASSERT(rig.controller->accumulator().buffer().empty());
        ASSERT(!rig.controller->accumulator().is_result_finalized());
        ASSERT(rig.controller->analyser() == nullptr);
        ASSERT(rig.devices.input->destroyed);
        // History and the shown result survive a disconnect
        ASSERT(rig.display.history().size() == 1);
        ASSERT(rig.display.result() == "8");

        // Stop again: nothing happens, nothing throws
        rig.log->clear();
        rig.controller->stop();
        ASSERT(rig.log->empty());
        ASSERT(rig.session()->close_calls == 1);
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);

        // The closed session object is released on the next poll
        rig.controller->poll();
        ASSERT(rig.session()->destroyed);
    }

    // --- Stop while the open is pending; late open is ignored ---
    {
        Rig rig;
        rig.build();
        ASSERT(rig.controller->connect().is_ok());
        auto pending = rig.session();
        ASSERT(rig.controller->state() == ConnectionState::Connecting);

        rig.controller->stop();
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(pending->close_calls == 1);

        // Handshake resolves afterwards and reports open anyway
        pending->handler(transport::InboundMessage::opened());
        pending->handler(transport::InboundMessage::transcription("1"));
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.display.expression().empty());
        ASSERT(pending->close_calls == 1);
        ASSERT(rig.controller->scheduler().active_count() == 0);

        // A fresh connect gets a new session; the old one's events stay ignored
        ASSERT(rig.controller->connect().is_ok());
        ASSERT(rig.connector.sessions.size() == 2);
        pending->handler(transport::InboundMessage::opened());
        ASSERT(rig.controller->state() == ConnectionState::Connecting);
        rig.deliver(transport::InboundMessage::opened());
        ASSERT(rig.controller->state() == ConnectionState::Connected);
        rig.controller->stop();
    }

    // --- Missing credential ---
    {
        Rig rig;
        rig.config.session.api_key.clear();
        rig.build();

        auto connected = rig.controller->connect();
        ASSERT(connected.is_error());
        ASSERT(connected.error().type == ErrorType::CredentialMissing);
        ASSERT(rig.controller->last_error().type == ErrorType::CredentialMissing);
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        std::vector<ConnectionState> expected = {
            ConnectionState::Connecting, ConnectionState::Error, ConnectionState::Disconnected
        };
        ASSERT(rig.states == expected);
        ASSERT(!rig.logged("input.open"));
        ASSERT(rig.connector.sessions.empty());

        // Environment wins over the config file
        setenv("GEMINI_API_KEY", "env-key", 1);
        ASSERT(rig.controller->connect().is_ok());
        ASSERT(rig.session()->api_key == "env-key");
        ASSERT(rig.controller->last_error().type == ErrorType::None);
        rig.controller->stop();
        clear_key_env();
    }

    // --- Device failure releases what was already acquired ---
    {
        Rig rig;
        rig.devices.fail_output = true;
        rig.build();

        auto connected = rig.controller->connect();
        ASSERT(connected.is_error());
        ASSERT(connected.error().type == ErrorType::DeviceAcquisitionFailure);
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.devices.input->stop_tracks_calls == 1);
        ASSERT(rig.devices.input->close_calls == 1);
        ASSERT(rig.devices.input->destroyed);
        ASSERT(rig.connector.sessions.empty());
        ASSERT(rig.controller->analyser() == nullptr);
    }

    // --- Transport open failures, immediate and asynchronous ---
    {
        Rig rig;
        rig.connector.fail_open = true;
        rig.build();
        auto connected = rig.controller->connect();
        ASSERT(connected.is_error());
        ASSERT(connected.error().type == ErrorType::TransportOpenFailure);
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.devices.output->close_calls == 1);

        rig.connector.fail_open = false;
        ASSERT(rig.controller->connect().is_ok());
        rig.states.clear();
        rig.deliver(transport::InboundMessage::failed(make_open_error("handshake rejected")));
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.controller->last_error().type == ErrorType::TransportOpenFailure);
        ASSERT(rig.states.size() == 2);
        ASSERT(rig.states[0] == ConnectionState::Error);
        ASSERT(rig.session()->close_calls == 1);
    }

    // --- Remote close and runtime errors tear everything down ---
    {
        Rig rig;
        rig.build();
        ASSERT(rig.controller->connect().is_ok());
        rig.deliver(transport::InboundMessage::opened());
        rig.deliver(audio_message(4800));
        rig.deliver(transport::InboundMessage::transcription("2かける"));

        auto first = rig.session();
        rig.deliver(transport::InboundMessage::closed("server going away"));
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.controller->scheduler().active_count() == 0);
        ASSERT(rig.controller->accumulator().buffer().empty());
        ASSERT(rig.devices.input->close_calls == 1);
        ASSERT(rig.devices.output->close_calls == 1);
        ASSERT(first->close_calls == 1);
        // Still referenced until the next poll
        ASSERT(!first->destroyed);
        rig.controller->poll();
        ASSERT(first->destroyed);

        ASSERT(rig.controller->connect().is_ok());
        rig.deliver(transport::InboundMessage::opened());
        rig.deliver(transport::InboundMessage::failed(make_transport_error("connection reset")));
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.controller->last_error().type == ErrorType::TransportRuntimeError);
    }

    // --- A release step that throws does not skip the ones after it ---
    {
        Rig rig;
        rig.build();
        ASSERT(rig.controller->connect().is_ok());
        rig.deliver(transport::InboundMessage::opened());
        rig.deliver(audio_message(2400));
        rig.devices.input->throw_on_stop_tracks = true;

        rig.log->clear();
        rig.controller->stop();
        std::vector<std::string> expected = {
            "input.stop_tracks",
            "input.close",
            "output.close",
            "session.close",
            "output.stop",
            "state:Disconnected",
        };
        ASSERT(*rig.log == expected);
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.controller->scheduler().active_count() == 0);
        rig.controller->poll();
        ASSERT(rig.session()->destroyed);
        ASSERT(rig.devices.input->destroyed);
    }

    // --- Failing sends are dropped; the session keeps running ---
    {
        Rig rig;
        rig.build();
        ASSERT(rig.controller->connect().is_ok());
        rig.deliver(transport::InboundMessage::opened());
        rig.session()->fail_sends = true;
        for (int i = 0; i < 5; ++i) {
            rig.devices.input->frames.push_back(FloatFrame(CAPTURE_FRAME_SAMPLES, 0.1f));
        }
        rig.controller->poll();
        ASSERT(rig.session()->sent_audio.empty());
        ASSERT(rig.devices.input->frames.empty());
        ASSERT(rig.controller->state() == ConnectionState::Connected);
    }

    // --- Finished playback leaves the active set ---
    {
        Rig rig;
        rig.build();
        ASSERT(rig.controller->connect().is_ok());
        rig.deliver(transport::InboundMessage::opened());
        rig.deliver(audio_message(2400));
        ASSERT(rig.controller->scheduler().active_count() == 1);
        testing::advance_output_clock(*rig.devices.output, 0.5);
        rig.controller->poll();
        ASSERT(rig.controller->scheduler().active_count() == 0);
    }

    // --- Presentation intents ---
    {
        Rig rig;
        rig.build();
        rig.controller->toggle_connection();
        ASSERT(rig.controller->state() == ConnectionState::Connecting);
        rig.controller->toggle_connection();
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);

        rig.controller->toggle_connection();
        rig.deliver(transport::InboundMessage::opened());
        rig.deliver(transport::InboundMessage::transcription("9ひく4"));
        transport::ToolCall call;
        call.id = "x";
        call.name = "displayResult";
        call.arguments = "{\"text\":\"5\"}";
        rig.deliver(transport::InboundMessage::tool_call_batch({call}));

        rig.controller->manual_reset();
        ASSERT(rig.display.result() == NEUTRAL_RESULT_TEXT);
        ASSERT(rig.display.expression().empty());
        ASSERT(rig.display.history().empty());
        ASSERT(!rig.controller->accumulator().is_result_finalized());
        ASSERT(rig.controller->state() == ConnectionState::Connected);
        ASSERT(rig.session()->close_calls == 0);

        rig.controller->toggle_connection();
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
    }

    // --- Destroying the controller mid-session releases everything ---
    {
        Rig rig;
        rig.build();
        ASSERT(rig.controller->connect().is_ok());
        rig.deliver(transport::InboundMessage::opened());
        auto session = rig.session();
        rig.controller.reset();
        ASSERT(session->close_calls == 1);
        ASSERT(session->destroyed);
        ASSERT(rig.devices.input->destroyed);
        ASSERT(rig.devices.output->closed);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All session tests passed.\n";
    return 0;
}
