#pragma once

#include "tool.h"
#include "display_model.h"
#include "transcription_accumulator.h"

namespace calcvox {

/**
 * @brief displayResult(text): show the answer and record it in the history
 *
 * The history entry pairs the answer with the expression accumulated so far;
 * the expression itself stays on screen until the next utterance starts.
 */
class DisplayResultTool : public Tool {
public:
    DisplayResultTool(DisplayModel& display, TranscriptionAccumulator& accumulator);

    std::string name() const override { return "displayResult"; }

    std::string description() const override {
        return "Display the calculated result immediately.";
    }

    std::string parameter_schema() const override;

    ToolResult execute(const std::string& args_json) override;

private:
    DisplayModel& display_;
    TranscriptionAccumulator& accumulator_;
};

/**
 * @brief resetApp(): back to a blank calculator
 */
class ResetAppTool : public Tool {
public:
    ResetAppTool(DisplayModel& display, TranscriptionAccumulator& accumulator);

    std::string name() const override { return "resetApp"; }

    std::string description() const override {
        return "Reset the calculator state.";
    }

    std::string parameter_schema() const override;

    ToolResult execute(const std::string& args_json) override;

private:
    DisplayModel& display_;
    TranscriptionAccumulator& accumulator_;
};

} // namespace calcvox
