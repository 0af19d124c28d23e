#pragma once

#include <string>

namespace calcvox {

/**
 * @brief Outcome of one tool invocation
 *
 * The agent is acknowledged either way; a failed result only changes what
 * gets logged.
 */
struct ToolResult {
    bool success = false;
    std::string content;  // Short summary for the log
    std::string error;    // Why the call changed nothing

    static ToolResult success_result(const std::string& content) {
        ToolResult result;
        result.success = true;
        result.content = content;
        return result;
    }

    static ToolResult error_result(const std::string& error_msg) {
        ToolResult result;
        result.success = false;
        result.error = error_msg;
        return result;
    }
};

/**
 * @brief A function the remote agent can call
 *
 * Each tool provides:
 * - a unique name (the function name on the wire)
 * - a description for the agent
 * - a JSON schema for its arguments
 * - execute(), which applies the call to local state
 *
 * execute() runs on the event loop and must not block.
 */
class Tool {
public:
    virtual ~Tool() = default;

    /**
     * @brief Function name as declared to the agent (e.g. "displayResult")
     */
    virtual std::string name() const = 0;

    /**
     * @brief What the tool does, in the agent's terms
     */
    virtual std::string description() const = 0;

    /**
     * @brief JSON schema (type OBJECT) for the call arguments
     */
    virtual std::string parameter_schema() const = 0;

    /**
     * @brief Apply the call
     * @param args_json JSON object with the call arguments ("{}" when none)
     */
    virtual ToolResult execute(const std::string& args_json) = 0;
};

} // namespace calcvox
