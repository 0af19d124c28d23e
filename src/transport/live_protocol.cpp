#include "transport/live_protocol.h"
#include "logger.h"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace calcvox {
namespace transport {
namespace live {

namespace {

std::string model_resource(const std::string& model) {
    if (model.rfind("models/", 0) == 0) {
        return model;
    }
    return "models/" + model;
}

std::string percent_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

/// Member as a string; "" when absent or of another type
std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

void collect_tool_calls(const json& tool_call, std::vector<InboundMessage>& out) {
    if (!tool_call.contains("functionCalls") || !tool_call["functionCalls"].is_array()) {
        Logger::warn("[Live] toolCall without functionCalls");
        return;
    }
    std::vector<ToolCall> calls;
    for (const auto& fc : tool_call["functionCalls"]) {
        if (!fc.is_object()) continue;
        ToolCall call;
        call.id = string_field(fc, "id");
        call.name = string_field(fc, "name");
        call.arguments = (fc.contains("args") && fc["args"].is_object()) ? fc["args"].dump() : "{}";
        calls.push_back(std::move(call));
    }
    if (!calls.empty()) {
        out.push_back(InboundMessage::tool_call_batch(std::move(calls)));
    }
}

void collect_audio_parts(const json& model_turn, std::vector<InboundMessage>& out) {
    if (!model_turn.contains("parts") || !model_turn["parts"].is_array()) {
        return;
    }
    for (const auto& part : model_turn["parts"]) {
        if (!part.is_object() || !part.contains("inlineData") || !part["inlineData"].is_object()) {
            continue;
        }
        const auto& inline_data = part["inlineData"];
        AudioChunk chunk;
        chunk.mime_type = string_field(inline_data, "mimeType");
        chunk.data = string_field(inline_data, "data");
        if (chunk.data.empty()) {
            continue;
        }
        if (!chunk.mime_type.empty() && chunk.mime_type.rfind("audio/", 0) != 0) {
            continue;
        }
        out.push_back(InboundMessage::audio_chunk(std::move(chunk)));
    }
}

} // namespace

std::string encode_setup(const SessionSetup& setup) {
    json declarations;
    try {
        declarations = json::parse(setup.function_declarations_json);
    } catch (const json::exception& e) {
        Logger::error(std::string("[Live] Invalid function declarations: ") + e.what());
        declarations = json::array();
    }

    json body;
    body["model"] = model_resource(setup.model);
    body["generationConfig"] = {{"responseModalities", json::array({"AUDIO"})}};
    if (!setup.system_instruction.empty()) {
        body["systemInstruction"] = {{"parts", json::array({{{"text", setup.system_instruction}}})}};
    }
    if (declarations.is_array() && !declarations.empty()) {
        body["tools"] = json::array({{{"functionDeclarations", declarations}}});
    }
    if (setup.input_transcription) {
        body["inputAudioTranscription"] = json::object();
    }

    json msg;
    msg["setup"] = body;
    return msg.dump();
}

std::string encode_audio(const AudioChunk& chunk) {
    json media;
    media["mimeType"] = chunk.mime_type;
    media["data"] = chunk.data;

    json msg;
    msg["realtimeInput"] = {{"mediaChunks", json::array({media})}};
    return msg.dump();
}

std::string encode_tool_responses(const std::vector<ToolResponse>& responses) {
    json function_responses = json::array();
    for (const auto& r : responses) {
        json entry;
        entry["id"] = r.id;
        entry["name"] = r.name;
        entry["response"] = {{"result", r.result}};
        function_responses.push_back(entry);
    }

    json msg;
    msg["toolResponse"] = {{"functionResponses", function_responses}};
    return msg.dump();
}

Result<std::vector<InboundMessage>> decode_server_message(const std::string& text) {
    json msg;
    try {
        msg = json::parse(text);
    } catch (const json::exception& e) {
        return make_error(ErrorType::InvalidArgument, std::string("server message is not JSON: ") + e.what());
    }
    if (!msg.is_object()) {
        return make_error(ErrorType::InvalidArgument, "server message is not a JSON object");
    }

    std::vector<InboundMessage> out;
    try {
        if (msg.contains("setupComplete")) {
            out.push_back(InboundMessage::opened());
        }

        const json* server_content = nullptr;
        if (msg.contains("serverContent") && msg["serverContent"].is_object()) {
            server_content = &msg["serverContent"];
        }

        if (server_content && server_content->contains("inputTranscription")) {
            const auto& tr = (*server_content)["inputTranscription"];
            if (tr.is_object() && tr.contains("text") && tr["text"].is_string()) {
                std::string fragment = tr["text"].get<std::string>();
                if (!fragment.empty()) {
                    out.push_back(InboundMessage::transcription(std::move(fragment)));
                }
            }
        }

        if (msg.contains("toolCall") && msg["toolCall"].is_object()) {
            collect_tool_calls(msg["toolCall"], out);
        }

        if (server_content && server_content->contains("modelTurn") &&
            (*server_content)["modelTurn"].is_object()) {
            collect_audio_parts((*server_content)["modelTurn"], out);
        }

        if (msg.contains("goAway")) {
            Logger::warn("[Live] Server announced disconnect: " + msg["goAway"].dump());
        }
    } catch (const json::exception& e) {
        return make_error(ErrorType::InvalidArgument, std::string("unexpected server message shape: ") + e.what());
    }
    return out;
}

std::string build_url(const std::string& endpoint, const std::string& api_key) {
    char separator = endpoint.find('?') == std::string::npos ? '?' : '&';
    return endpoint + separator + "key=" + percent_encode(api_key);
}

} // namespace live
} // namespace transport
} // namespace calcvox
