#pragma once

/**
 * @file live_protocol.h
 * @brief JSON wire format of the Live (BidiGenerateContent) API
 */

#include "transport/transport_session.h"
#include "errors.h"
#include <string>
#include <vector>

namespace calcvox {
namespace transport {
namespace live {

/// First client message: model, system instruction, tools, AUDIO modality
std::string encode_setup(const SessionSetup& setup);

/// realtimeInput with a single media chunk
std::string encode_audio(const AudioChunk& chunk);

/// toolResponse carrying every reply of one batch
std::string encode_tool_responses(const std::vector<ToolResponse>& responses);

/**
 * @brief Split one server message into inbound events
 *
 * Order within a message: SessionOpened, TranscriptionFragment,
 * ToolCallBatch, AudioChunk (one per inline audio part).
 * Messages with nothing of interest (turnComplete, usage metadata) yield
 * an empty list.
 * @return Events, or InvalidArgument when the text is not a JSON object
 */
Result<std::vector<InboundMessage>> decode_server_message(const std::string& text);

/// Append the API key as a query parameter
std::string build_url(const std::string& endpoint, const std::string& api_key);

} // namespace live
} // namespace transport
} // namespace calcvox
