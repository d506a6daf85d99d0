#pragma once

#include "footfall/core/types.hpp"
#include "footfall/session/session_store.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace footfall {

/**
 * @brief Immutable result of one frame as seen by readers
 */
struct FrameSnapshot {
    uint64_t sequence = 0;
    uint64_t frame_id = 0;
    FrameSize frame_size;
    std::vector<AnnotatedTrack> tracks;
    std::vector<Session> sessions;
    size_t active_sessions = 0;
    bool final = false;  // Last snapshot of a run
};

using FrameSnapshotPtr = std::shared_ptr<const FrameSnapshot>;

/**
 * @brief Single-slot latest-value hand-off from the worker to readers
 *
 * The writer replaces the slot and never waits for readers. Readers either
 * take whatever is current or block (bounded) until a newer sequence
 * number appears.
 */
class SnapshotPublisher {
public:
    /**
     * @brief Publish a snapshot, assigning it the next sequence number
     *
     * @return Sequence number assigned
     */
    uint64_t publish(FrameSnapshot snapshot);

    /**
     * @brief Latest snapshot, or nullptr if nothing was published
     */
    FrameSnapshotPtr latest() const;

    /**
     * @brief Wait for a snapshot newer than after_sequence
     *
     * @return Newer snapshot, or nullptr on timeout
     */
    FrameSnapshotPtr wait_for_newer(uint64_t after_sequence,
                                    std::chrono::milliseconds timeout = std::chrono::seconds(1)) const;

    /**
     * @brief Drop the current snapshot (sequence numbers keep increasing)
     */
    void reset();

    uint64_t sequence() const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    FrameSnapshotPtr latest_;
    uint64_t sequence_ = 0;
};

}  // namespace footfall
