#pragma once

#include "display_model.h"
#include <string>

namespace calcvox {

/**
 * @brief Rebuilds the spoken expression from streamed transcription fragments
 *
 * Fragments are appended to the buffer of the current utterance. There is
 * no explicit end-of-utterance signal: once a result has been finalized,
 * the next fragment starts a new utterance (buffer and displayed expression
 * cleared first). After every append the buffer is published as the
 * displayed expression.
 */
class TranscriptionAccumulator {
public:
    explicit TranscriptionAccumulator(DisplayModel& display);

    /// Empty fragments are ignored
    void append_fragment(const std::string& fragment);

    /// A result was shown for the current buffer; next fragment starts over
    void mark_result_finalized();

    /// Buffer and displayed expression cleared, flag cleared (resetApp / manual reset)
    void reset();

    /// Buffer and flag cleared, display untouched (session teardown)
    void clear();

    const std::string& buffer() const { return buffer_; }
    bool is_result_finalized() const { return result_finalized_; }

private:
    DisplayModel& display_;
    std::string buffer_;
    bool result_finalized_;
};

} // namespace calcvox
