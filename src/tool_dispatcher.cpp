#include "tool_dispatcher.h"
#include "logger.h"

namespace calcvox {

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry)
    : registry_(registry), unrecognized_count_(0) {
}

std::vector<transport::ToolResponse> ToolDispatcher::execute_batch(const std::vector<transport::ToolCall>& calls) {
    std::vector<transport::ToolResponse> responses;
    responses.reserve(calls.size());

    for (const auto& call : calls) {
        auto tool = registry_.get_tool(call.name);
        if (!tool) {
            ++unrecognized_count_;
            Logger::debug("[Tools] " + Error(ErrorType::UnrecognizedToolCall, call.name).to_string());
        } else {
            ToolResult result = tool->execute(call.arguments.empty() ? "{}" : call.arguments);
            if (result.success) {
                LOG_TOOLS(call.name + ": " + result.content);
            } else {
                Logger::warn("[Tools] " + call.name + " ignored: " + result.error);
            }
        }

        transport::ToolResponse response;
        response.id = call.id;
        response.name = call.name;
        responses.push_back(response);
    }
    return responses;
}

VoidResult ToolDispatcher::dispatch(const std::vector<transport::ToolCall>& calls,
                                    transport::TransportSession& session) {
    if (calls.empty()) {
        return {};
    }
    auto responses = execute_batch(calls);
    auto sent = session.send_tool_responses(responses);
    if (!sent) {
        Logger::error("[Tools] Failed to acknowledge " + std::to_string(responses.size()) +
                      " call(s): " + sent.error().message);
    }
    return sent;
}

} // namespace calcvox
