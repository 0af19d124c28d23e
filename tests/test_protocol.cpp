/**
 * Wire protocol and ambient plumbing tests: Live API message encoding and
 * decoding, config parsing and credential lookup, the connection state
 * machine and the event loop.
 *
 * Run from build dir: ./test_protocol
 * No network required.
 */

#include "config.h"
#include "event_loop.h"
#include "logger.h"
#include "state_machine.h"
#include "transport/live_protocol.h"
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace calcvox;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- setup message ---
    {
        transport::SessionSetup setup;
        setup.model = "gemini-2.5-flash-native-audio-preview-12-2025";
        setup.system_instruction = "計算してください";
        setup.function_declarations_json = R"([{"name":"resetApp","description":"Reset","parameters":{"type":"OBJECT","properties":{}}}])";

        json msg = json::parse(transport::live::encode_setup(setup));
        const json& body = msg["setup"];
        ASSERT(body["model"] == "models/gemini-2.5-flash-native-audio-preview-12-2025");
        ASSERT(body["generationConfig"]["responseModalities"][0] == "AUDIO");
        ASSERT(body["systemInstruction"]["parts"][0]["text"] == "計算してください");
        ASSERT(body["tools"][0]["functionDeclarations"][0]["name"] == "resetApp");
        ASSERT(body.contains("inputAudioTranscription"));

        // Already-qualified model names are kept, no tools -> no tools key
        setup.model = "models/custom";
        setup.function_declarations_json = "[]";
        setup.input_transcription = false;
        msg = json::parse(transport::live::encode_setup(setup));
        ASSERT(msg["setup"]["model"] == "models/custom");
        ASSERT(!msg["setup"].contains("tools"));
        ASSERT(!msg["setup"].contains("inputAudioTranscription"));
    }

    // --- audio and tool responses ---
    {
        transport::AudioChunk chunk;
        chunk.mime_type = "audio/pcm;rate=16000";
        chunk.data = "AEA=";
        json audio = json::parse(transport::live::encode_audio(chunk));
        ASSERT(audio["realtimeInput"]["mediaChunks"].size() == 1);
        ASSERT(audio["realtimeInput"]["mediaChunks"][0]["mimeType"] == "audio/pcm;rate=16000");
        ASSERT(audio["realtimeInput"]["mediaChunks"][0]["data"] == "AEA=");

        std::vector<transport::ToolResponse> responses(2);
        responses[0].id = "a";
        responses[0].name = "displayResult";
        responses[1].id = "b";
        responses[1].name = "unknownTool";
        json reply = json::parse(transport::live::encode_tool_responses(responses));
        const json& list = reply["toolResponse"]["functionResponses"];
        ASSERT(list.size() == 2);
        ASSERT(list[0]["id"] == "a");
        ASSERT(list[1]["name"] == "unknownTool");
        ASSERT(list[1]["response"]["result"] == "ok");
    }

    // --- decode: setupComplete ---
    {
        auto events = transport::live::decode_server_message(R"({"setupComplete":{}})");
        ASSERT(events.is_ok());
        ASSERT(events.value().size() == 1);
        ASSERT(events.value()[0].kind == transport::InboundKind::SessionOpened);
    }

    // --- decode: one message with transcription, tool call and audio ---
    {
        const char* text = R"({
            "serverContent": {
                "inputTranscription": {"text": "3たす5"},
                "modelTurn": {"parts": [
                    {"inlineData": {"mimeType": "audio/pcm;rate=24000", "data": "AAAA"}},
                    {"text": "ignored"},
                    {"inlineData": {"mimeType": "audio/pcm;rate=24000", "data": "AQAB"}}
                ]}
            },
            "toolCall": {"functionCalls": [
                {"id": "fc-1", "name": "displayResult", "args": {"text": "8"}},
                {"id": "fc-2", "name": "resetApp"}
            ]}
        })";
        auto events = transport::live::decode_server_message(text);
        ASSERT(events.is_ok());
        const auto& list = events.value();
        ASSERT(list.size() == 4);
        if (list.size() == 4) {
            ASSERT(list[0].kind == transport::InboundKind::TranscriptionFragment);
            ASSERT(list[0].text == "3たす5");
            ASSERT(list[1].kind == transport::InboundKind::ToolCallBatch);
            ASSERT(list[1].tool_calls.size() == 2);
            ASSERT(list[1].tool_calls[0].id == "fc-1");
            ASSERT(json::parse(list[1].tool_calls[0].arguments)["text"] == "8");
            ASSERT(list[1].tool_calls[1].arguments == "{}");
            ASSERT(list[2].kind == transport::InboundKind::AudioChunk);
            ASSERT(list[2].audio.data == "AAAA");
            ASSERT(list[3].audio.data == "AQAB");
        }
    }

    // --- decode: mistyped call fields still produce a call to acknowledge ---
    {
        auto events = transport::live::decode_server_message(
            R"({"toolCall":{"functionCalls":[{"id":7,"name":"displayResult","args":{"text":"1"}},{"id":"fc-9","name":null}]}})");
        ASSERT(events.is_ok());
        ASSERT(events.value().size() == 1);
        if (events.value().size() == 1) {
            const auto& calls = events.value()[0].tool_calls;
            ASSERT(calls.size() == 2);
            ASSERT(calls[0].id.empty());
            ASSERT(calls[0].name == "displayResult");
            ASSERT(calls[1].id == "fc-9");
            ASSERT(calls[1].name.empty());
        }

        auto audio = transport::live::decode_server_message(
            R"({"serverContent":{"modelTurn":{"parts":[{"inlineData":{"mimeType":5,"data":"AAAA"}}]}}})");
        ASSERT(audio.is_ok());
        ASSERT(audio.value().size() == 1);
    }

    // --- decode: nothing of interest, garbage, non-audio parts ---
    {
        auto quiet = transport::live::decode_server_message(R"({"serverContent":{"turnComplete":true}})");
        ASSERT(quiet.is_ok());
        ASSERT(quiet.value().empty());

        auto go_away = transport::live::decode_server_message(R"({"goAway":{"timeLeft":"10s"}})");
        ASSERT(go_away.is_ok());
        ASSERT(go_away.value().empty());

        auto empty_text = transport::live::decode_server_message(R"({"serverContent":{"inputTranscription":{"text":""}}})");
        ASSERT(empty_text.is_ok());
        ASSERT(empty_text.value().empty());

        auto image = transport::live::decode_server_message(
            R"({"serverContent":{"modelTurn":{"parts":[{"inlineData":{"mimeType":"image/png","data":"AAAA"}}]}}})");
        ASSERT(image.is_ok());
        ASSERT(image.value().empty());

        ASSERT(transport::live::decode_server_message("not json").is_error());
        ASSERT(transport::live::decode_server_message("[1,2]").is_error());
    }

    // --- URL ---
    {
        ASSERT(transport::live::build_url("wss://host/path", "abc") == "wss://host/path?key=abc");
        ASSERT(transport::live::build_url("wss://host/path?alt=1", "a+b/c") == "wss://host/path?alt=1&key=a%2Bb%2Fc");
    }

    // --- Config ---
    {
        auto defaults = Config::parse("{}");
        ASSERT(defaults.is_ok());
        ASSERT(defaults.value().audio.input_sample_rate == 16000);
        ASSERT(defaults.value().audio.output_sample_rate == 24000);
        ASSERT(defaults.value().audio.capture_frame_samples == 4096);
        ASSERT(defaults.value().session.model == "gemini-2.5-flash-native-audio-preview-12-2025");
        ASSERT(!defaults.value().session.system_instruction.empty());

        auto custom = Config::parse(R"({
            "audio": {"input_device": "USB Mic", "capture_frame_samples": 2048},
            "session": {"model": "other-model", "system_instruction": ["line one", "line two"]},
            "logging": {"level": "debug"}
        })");
        ASSERT(custom.is_ok());
        ASSERT(custom.value().audio.input_device == "USB Mic");
        ASSERT(custom.value().audio.capture_frame_samples == 2048);
        ASSERT(custom.value().session.model == "other-model");
        ASSERT(custom.value().session.system_instruction == "line one\nline two");
        ASSERT(custom.value().logging.level == "debug");

        auto broken = Config::parse("{ nope");
        ASSERT(broken.is_error());
        ASSERT(broken.error().type == ErrorType::ConfigError);

        auto invalid = Config::parse(R"({"audio": {"input_sample_rate": 0}})");
        ASSERT(invalid.is_error());

        Config missing = Config::load_from_file("/nonexistent/calcvox.json");
        ASSERT(missing.audio.output_sample_rate == 24000);

        ASSERT(parse_log_level("DEBUG") == LogLevel::DEBUG);
        ASSERT(parse_log_level("warning") == LogLevel::WARN);
        ASSERT(parse_log_level("loud", LogLevel::ERROR) == LogLevel::ERROR);
    }

    // --- Credential lookup order ---
    {
        unsetenv("CALCVOX_API_KEY");
        unsetenv("GEMINI_API_KEY");
        unsetenv("API_KEY");

        SessionConfig session;
        auto none = resolve_api_key(session);
        ASSERT(none.is_error());
        ASSERT(none.error().type == ErrorType::CredentialMissing);

        session.api_key = "from-file";
        ASSERT(resolve_api_key(session).value() == "from-file");

        setenv("API_KEY", "generic", 1);
        ASSERT(resolve_api_key(session).value() == "generic");
        setenv("CALCVOX_API_KEY", "specific", 1);
        ASSERT(resolve_api_key(session).value() == "specific");

        unsetenv("CALCVOX_API_KEY");
        unsetenv("API_KEY");
    }

    // --- Connection state machine ---
    {
        ConnectionStateMachine sm;
        std::vector<std::pair<ConnectionState, ConnectionState>> changes;
        sm.set_listener([&](ConnectionState prev, ConnectionState cur) { changes.emplace_back(prev, cur); });

        ASSERT(sm.get_state() == ConnectionState::Disconnected);
        ASSERT(!sm.on_remote_open());
        ASSERT(sm.on_connect_requested());
        ASSERT(!sm.on_connect_requested());
        ASSERT(sm.get_state() == ConnectionState::Connecting);
        ASSERT(sm.on_remote_open());
        ASSERT(sm.is_connected());
        ASSERT(!sm.on_connect_requested());

        sm.on_failure();
        ASSERT(sm.get_state() == ConnectionState::Error);
        ASSERT(!sm.on_connect_requested());
        sm.on_teardown_complete();
        ASSERT(sm.get_state() == ConnectionState::Disconnected);
        sm.on_teardown_complete();

        ASSERT(changes.size() == 4);
        ASSERT(changes[0].first == ConnectionState::Disconnected);
        ASSERT(changes[0].second == ConnectionState::Connecting);
        ASSERT(changes[3].second == ConnectionState::Disconnected);
        ASSERT(std::string(to_string(ConnectionState::Error)) == "Error");
    }

    // --- Event loop ---
    {
        EventLoop loop;
        std::vector<int> order;
        loop.post([&]() { order.push_back(1); });
        loop.post([&]() { throw std::runtime_error("handler failure"); });
        loop.post([&]() {
            order.push_back(2);
            loop.post([&]() { order.push_back(3); });
        });
        ASSERT(loop.run_pending() == 3);
        ASSERT(order.size() == 2);
        ASSERT(loop.run_pending() == 1);
        ASSERT(order.size() == 3 && order[2] == 3);
        ASSERT(loop.run_pending() == 0);

        int idle_calls = 0;
        loop.post([&]() { order.push_back(4); });
        loop.run([&]() {
            if (++idle_calls == 3) loop.quit();
        }, 1);
        ASSERT(idle_calls == 3);
        ASSERT(order.back() == 4);
        ASSERT(loop.is_loop_thread());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All protocol tests passed.\n";
    return 0;
}
