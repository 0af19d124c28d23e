#include "transport/transport_session.h"

namespace calcvox {
namespace transport {

const char* to_string(InboundKind kind) {
    switch (kind) {
        case InboundKind::SessionOpened: return "session-opened";
        case InboundKind::TranscriptionFragment: return "transcription";
        case InboundKind::ToolCallBatch: return "tool-call-batch";
        case InboundKind::AudioChunk: return "audio-chunk";
        case InboundKind::SessionClosed: return "session-closed";
        case InboundKind::SessionError: return "session-error";
    }
    return "unknown";
}

InboundMessage InboundMessage::opened() {
    InboundMessage m;
    m.kind = InboundKind::SessionOpened;
    return m;
}

InboundMessage InboundMessage::transcription(std::string text) {
    InboundMessage m;
    m.kind = InboundKind::TranscriptionFragment;
    m.text = std::move(text);
    return m;
}

InboundMessage InboundMessage::tool_call_batch(std::vector<ToolCall> calls) {
    InboundMessage m;
    m.kind = InboundKind::ToolCallBatch;
    m.tool_calls = std::move(calls);
    return m;
}

InboundMessage InboundMessage::audio_chunk(AudioChunk chunk) {
    InboundMessage m;
    m.kind = InboundKind::AudioChunk;
    m.audio = std::move(chunk);
    return m;
}

InboundMessage InboundMessage::closed(std::string reason) {
    InboundMessage m;
    m.kind = InboundKind::SessionClosed;
    m.text = std::move(reason);
    return m;
}

InboundMessage InboundMessage::failed(Error error) {
    InboundMessage m;
    m.kind = InboundKind::SessionError;
    m.error = std::move(error);
    return m;
}

} // namespace transport
} // namespace calcvox
