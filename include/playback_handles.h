#pragma once

#include "audio_device.h"
#include <cstdint>
#include <vector>

namespace calcvox {

/**
 * @brief Stable reference to a slot in PlaybackHandleSet
 *
 * The generation makes a handle go stale once its slot is released, so a
 * late ended-callback can never remove a newer voice that reused the slot.
 */
struct PlaybackHandle {
    uint32_t index = 0;
    uint32_t generation = 0;

    bool operator==(const PlaybackHandle& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const PlaybackHandle& other) const { return !(*this == other); }
};

/**
 * @brief Arena of in-flight playback voices
 *
 * O(1) insert and remove, index-stable slots, free list reuse.
 * clear() invalidates every outstanding handle.
 */
class PlaybackHandleSet {
public:
    PlaybackHandleSet();

    /// Occupy a slot; the voice id can be filled in later with assign()
    PlaybackHandle insert(PlaybackVoiceId voice = 0);

    /// @return False when the handle is stale
    bool assign(PlaybackHandle handle, PlaybackVoiceId voice);

    /// @return False when the handle is stale (already removed or cleared)
    bool remove(PlaybackHandle handle);

    bool contains(PlaybackHandle handle) const;

    /// @return False when the handle is stale
    bool lookup(PlaybackHandle handle, PlaybackVoiceId& voice) const;

    /// Voice ids of every live slot
    std::vector<PlaybackVoiceId> voices() const;

    void clear();

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    /// Slots allocated so far (live or free)
    size_t capacity() const { return slots_.size(); }

private:
    struct Slot {
        PlaybackVoiceId voice = 0;
        uint32_t generation = 1;
        bool occupied = false;
    };

    void release(uint32_t index);

    std::vector<Slot> slots_;
    std::vector<uint32_t> free_;
    size_t count_;
};

} // namespace calcvox
