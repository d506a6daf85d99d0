#include "footfall/pipeline/publisher.hpp"

namespace footfall {

uint64_t SnapshotPublisher::publish(FrameSnapshot snapshot) {
    uint64_t sequence;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sequence = ++sequence_;
        snapshot.sequence = sequence;
        latest_ = std::make_shared<const FrameSnapshot>(std::move(snapshot));
    }
    cv_.notify_all();
    return sequence;
}

FrameSnapshotPtr SnapshotPublisher::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

FrameSnapshotPtr SnapshotPublisher::wait_for_newer(uint64_t after_sequence,
                                                   std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);

    bool ready = cv_.wait_for(lock, timeout, [this, after_sequence]() {
        return latest_ != nullptr && latest_->sequence > after_sequence;
    });

    return ready ? latest_ : nullptr;
}

void SnapshotPublisher::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_.reset();
}

uint64_t SnapshotPublisher::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

}  // namespace footfall
