#pragma once

/**
 * @file transport_session.h
 * @brief Bidirectional session with the remote conversational agent
 *
 * Defines the message types exchanged with the agent and the abstract
 * session/connector pair. The WebSocket backend lives in
 * websocket_session.h; tests use an in-memory fake.
 */

#include "errors.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace calcvox {
namespace transport {

/// Encoded audio carried in either direction
struct AudioChunk {
    std::string mime_type;
    std::string data;   ///< base64 payload
};

/// One function invocation requested by the agent
struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments;  ///< JSON object as a string ("{}" when absent)
};

/// Reply to one ToolCall
struct ToolResponse {
    std::string id;
    std::string name;
    std::string result = "ok";
};

enum class InboundKind {
    SessionOpened,
    TranscriptionFragment,
    ToolCallBatch,
    AudioChunk,
    SessionClosed,
    SessionError
};

const char* to_string(InboundKind kind);

/**
 * @brief One event delivered by the receive stream
 *
 * Only the field matching kind is meaningful.
 */
struct InboundMessage {
    InboundKind kind = InboundKind::SessionClosed;
    std::string text;                 ///< TranscriptionFragment text, SessionClosed reason
    std::vector<ToolCall> tool_calls; ///< ToolCallBatch
    AudioChunk audio;                 ///< AudioChunk
    Error error;                      ///< SessionError

    static InboundMessage opened();
    static InboundMessage transcription(std::string text);
    static InboundMessage tool_call_batch(std::vector<ToolCall> calls);
    static InboundMessage audio_chunk(AudioChunk chunk);
    static InboundMessage closed(std::string reason);
    static InboundMessage failed(Error error);
};

using InboundHandler = std::function<void(const InboundMessage&)>;

/**
 * @brief What the agent is told when the session starts
 */
struct SessionSetup {
    std::string model;
    std::string system_instruction;
    std::string function_declarations_json = "[]";  ///< JSON array
    bool input_transcription = true;
};

/**
 * @brief Handle to one open (or opening) session
 *
 * All methods are called from the event loop thread. Inbound events are
 * delivered to the InboundHandler given at open time, also on the loop.
 */
class TransportSession {
public:
    virtual ~TransportSession() = default;

    /// Send one captured audio frame
    virtual VoidResult send_audio(const AudioChunk& chunk) = 0;

    /// Send the replies for one tool-call batch as a single message
    virtual VoidResult send_tool_responses(const std::vector<ToolResponse>& responses) = 0;

    /**
     * @brief Close the session
     *
     * Safe while the open is still pending: the connection is dropped as
     * soon as the handshake resolves and no further events are delivered.
     * Idempotent.
     */
    virtual VoidResult close() = 0;

    /// Pump the receive side; delivers zero or more InboundMessages
    virtual void poll() = 0;
};

/**
 * @brief Opens sessions
 */
class TransportConnector {
public:
    virtual ~TransportConnector() = default;

    /**
     * @brief Start opening a session
     *
     * Returns immediately. SessionOpened is delivered once the agent accepted
     * the setup; a failed open is delivered as SessionError carrying
     * TransportOpenFailure.
     * @return Pending session, or TransportOpenFailure when the attempt cannot even start
     */
    virtual Result<std::unique_ptr<TransportSession>> open(const SessionSetup& setup,
                                                           const std::string& api_key,
                                                           InboundHandler handler) = 0;
};

} // namespace transport
} // namespace calcvox
