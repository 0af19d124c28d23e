#include "playback_scheduler.h"
#include "pcm_codec.h"
#include "logger.h"
#include <algorithm>
#include <sstream>

namespace calcvox {

PlaybackScheduler::PlaybackScheduler()
    : output_(nullptr), next_start_time_(0.0), dropped_fragments_(0) {
}

PlaybackScheduler::~PlaybackScheduler() {
    hard_stop();
}

void PlaybackScheduler::attach(AudioOutput* output) {
    output_ = output;
}

void PlaybackScheduler::detach() {
    output_ = nullptr;
}

VoidResult PlaybackScheduler::enqueue(const transport::AudioChunk& chunk) {
    if (!output_) {
        return make_error(ErrorType::InvalidArgument, "no output device attached");
    }

    auto decoded = pcm::decode_fragment(chunk.data);
    if (!decoded) {
        ++dropped_fragments_;
        Logger::warn("[Playback] Dropping fragment: " + decoded.error().message);
        return decoded.error();
    }

    FloatBuffer samples = std::move(decoded.value());
    double duration = static_cast<double>(samples.size()) / output_->sample_rate();
    double start_at = std::max(next_start_time_, output_->current_time());

    // Slot first so the ended callback can name it
    PlaybackHandle handle = active_.insert();
    auto scheduled = output_->schedule(std::move(samples), start_at,
                                       [this, handle]() { on_voice_ended(handle); });
    if (!scheduled) {
        active_.remove(handle);
        Logger::error("[Playback] Failed to schedule fragment: " + scheduled.error().message);
        return scheduled.error();
    }
    active_.assign(handle, scheduled.value());
    next_start_time_ = start_at + duration;

    std::ostringstream oss;
    oss << "Scheduled " << duration * 1000.0 << " ms at " << start_at
        << " s (active " << active_.size() << ")";
    LOG_PLAYBACK(oss.str());
    return {};
}

void PlaybackScheduler::hard_stop() {
    if (output_) {
        for (PlaybackVoiceId voice : active_.voices()) {
            output_->stop(voice);
        }
    }
    if (!active_.empty()) {
        LOG_PLAYBACK("Hard stop: " + std::to_string(active_.size()) + " voice(s) cut");
    }
    active_.clear();
    next_start_time_ = 0.0;
}

void PlaybackScheduler::on_voice_ended(PlaybackHandle handle) {
    // Stale after hard_stop(); nothing to do
    active_.remove(handle);
}

} // namespace calcvox
