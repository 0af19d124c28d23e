#include "tools/calculator_tools.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace calcvox {

DisplayResultTool::DisplayResultTool(DisplayModel& display, TranscriptionAccumulator& accumulator)
    : display_(display), accumulator_(accumulator) {
}

std::string DisplayResultTool::parameter_schema() const {
    json schema;
    schema["type"] = "OBJECT";
    schema["properties"]["text"] = json::object({
        {"type", "STRING"},
        {"description", "The numeric result or short text to display (e.g. \"8\")."}
    });
    schema["required"] = json::array({"text"});
    return schema.dump();
}

ToolResult DisplayResultTool::execute(const std::string& args_json) {
    json args;
    try {
        args = json::parse(args_json);
    } catch (const json::exception& e) {
        return ToolResult::error_result(std::string("Arguments are not JSON: ") + e.what());
    }

    if (!args.is_object() || !args.contains("text")) {
        return ToolResult::error_result("Missing 'text' parameter");
    }

    const auto& value = args["text"];
    std::string text;
    if (value.is_string()) {
        text = value.get<std::string>();
    } else if (value.is_number()) {
        // Agents occasionally send the bare number
        text = value.dump();
    } else {
        return ToolResult::error_result("Invalid 'text' parameter: " + value.dump());
    }

    display_.set_result(text);

    CalculationLog entry;
    entry.expression = accumulator_.buffer();
    entry.result = text;
    entry.timestamp_ms = wall_clock_ms();
    display_.add_history(entry);

    accumulator_.mark_result_finalized();
    return ToolResult::success_result(entry.to_string());
}

ResetAppTool::ResetAppTool(DisplayModel& display, TranscriptionAccumulator& accumulator)
    : display_(display), accumulator_(accumulator) {
}

std::string ResetAppTool::parameter_schema() const {
    json schema;
    schema["type"] = "OBJECT";
    schema["properties"] = json::object();
    return schema.dump();
}

ToolResult ResetAppTool::execute(const std::string&) {
    accumulator_.reset();
    display_.reset();
    return ToolResult::success_result("calculator reset");
}

} // namespace calcvox
