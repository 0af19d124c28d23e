#include "capture_pipeline.h"
#include "pcm_codec.h"
#include "logger.h"

namespace calcvox {

namespace {
constexpr int64_t SEND_FAILURE_LOG_INTERVAL_MS = 2000;
}

CapturePipeline::CapturePipeline(const ConnectionStateMachine& state, FrequencyAnalyser& analyser)
    : state_(state), analyser_(analyser), input_(nullptr),
      frames_sent_(0), send_failures_(0), failures_since_log_(0) {
}

void CapturePipeline::attach(AudioInput* input) {
    input_ = input;
    frames_sent_ = 0;
    send_failures_ = 0;
    failures_since_log_ = 0;
}

void CapturePipeline::detach() {
    input_ = nullptr;
    if (frames_sent_ > 0 || send_failures_ > 0) {
        LOG_CAPTURE("Detached after " + std::to_string(frames_sent_) + " frame(s) sent, " +
                    std::to_string(send_failures_) + " failed");
    }
}

size_t CapturePipeline::pump(transport::TransportSession* session) {
    if (!input_) {
        return 0;
    }

    size_t sent = 0;
    while (input_ && input_->read_frame(frame_)) {
        analyser_.push(frame_);

        if (!session || state_.get_state() != ConnectionState::Connected) {
            continue;
        }

        transport::AudioChunk chunk;
        chunk.mime_type = INPUT_AUDIO_MIME;
        chunk.data = pcm::encode_frame(frame_);

        auto result = session->send_audio(chunk);
        if (!result) {
            report_send_failure(result.error());
            continue;
        }
        ++frames_sent_;
        ++sent;
    }
    return sent;
}

void CapturePipeline::report_send_failure(const Error& error) {
    ++send_failures_;
    ++failures_since_log_;
    if (send_failures_ == 1 || ms_since(last_failure_log_) >= SEND_FAILURE_LOG_INTERVAL_MS) {
        Logger::warn("[Capture] Dropped " + std::to_string(failures_since_log_) +
                     " frame(s): " + error.message);
        failures_since_log_ = 0;
        last_failure_log_ = Clock::now();
    }
}

} // namespace calcvox
