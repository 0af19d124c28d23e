#include "transcription_accumulator.h"
#include "logger.h"

namespace calcvox {

TranscriptionAccumulator::TranscriptionAccumulator(DisplayModel& display)
    : display_(display), result_finalized_(false) {
}

void TranscriptionAccumulator::append_fragment(const std::string& fragment) {
    if (fragment.empty()) {
        return;
    }

    if (result_finalized_) {
        // New utterance after a shown result
        buffer_.clear();
        display_.set_expression("");
        result_finalized_ = false;
    }

    buffer_ += fragment;
    display_.set_expression(buffer_);
    Logger::debug("[Transcription] \"" + buffer_ + "\"");
}

void TranscriptionAccumulator::mark_result_finalized() {
    result_finalized_ = true;
}

void TranscriptionAccumulator::reset() {
    buffer_.clear();
    result_finalized_ = false;
    display_.set_expression("");
}

void TranscriptionAccumulator::clear() {
    buffer_.clear();
    result_finalized_ = false;
}

} // namespace calcvox
