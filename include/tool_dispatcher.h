#pragma once

#include "tool_registry.h"
#include "transport/transport_session.h"
#include "errors.h"
#include <vector>

namespace calcvox {

/// Runs tool-call batches against the registry and acknowledges them.
class ToolDispatcher {
public:
    explicit ToolDispatcher(const ToolRegistry& registry);

    /**
     * Execute every call in delivery order and build one reply per call.
     * Unknown names and calls with bad arguments change nothing but are
     * still answered "ok".
     */
    std::vector<transport::ToolResponse> execute_batch(const std::vector<transport::ToolCall>& calls);

    /// execute_batch() then send all replies as a single message.
    VoidResult dispatch(const std::vector<transport::ToolCall>& calls, transport::TransportSession& session);

    /// Calls seen with a name no tool answers to.
    size_t unrecognized_count() const { return unrecognized_count_; }

private:
    const ToolRegistry& registry_;
    size_t unrecognized_count_;
};

} // namespace calcvox
