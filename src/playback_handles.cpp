#include "playback_handles.h"

namespace calcvox {

PlaybackHandleSet::PlaybackHandleSet()
    : count_(0) {
}

PlaybackHandle PlaybackHandleSet::insert(PlaybackVoiceId voice) {
    uint32_t index;
    if (!free_.empty()) {
        index = free_.back();
        free_.pop_back();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    Slot& slot = slots_[index];
    slot.voice = voice;
    slot.occupied = true;
    ++count_;

    PlaybackHandle handle;
    handle.index = index;
    handle.generation = slot.generation;
    return handle;
}

bool PlaybackHandleSet::assign(PlaybackHandle handle, PlaybackVoiceId voice) {
    if (!contains(handle)) {
        return false;
    }
    slots_[handle.index].voice = voice;
    return true;
}

bool PlaybackHandleSet::remove(PlaybackHandle handle) {
    if (!contains(handle)) {
        return false;
    }
    release(handle.index);
    return true;
}

bool PlaybackHandleSet::contains(PlaybackHandle handle) const {
    if (handle.index >= slots_.size()) {
        return false;
    }
    const Slot& slot = slots_[handle.index];
    return slot.occupied && slot.generation == handle.generation;
}

bool PlaybackHandleSet::lookup(PlaybackHandle handle, PlaybackVoiceId& voice) const {
    if (!contains(handle)) {
        return false;
    }
    voice = slots_[handle.index].voice;
    return true;
}

std::vector<PlaybackVoiceId> PlaybackHandleSet::voices() const {
    std::vector<PlaybackVoiceId> out;
    out.reserve(count_);
    for (const auto& slot : slots_) {
        if (slot.occupied) {
            out.push_back(slot.voice);
        }
    }
    return out;
}

void PlaybackHandleSet::clear() {
    for (uint32_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].occupied) {
            release(i);
        }
    }
}

void PlaybackHandleSet::release(uint32_t index) {
    Slot& slot = slots_[index];
    slot.occupied = false;
    slot.voice = 0;
    ++slot.generation;
    free_.push_back(index);
    --count_;
}

} // namespace calcvox
