#include "controller/FrameScheduler.hpp"

#include <algorithm>

namespace blockfall::controller {

IFrameScheduler::FrameId FrameQueue::requestFrame(FrameCallback callback) {
    const FrameId id = nextId_++;
    pending_.push_back(Entry{id, std::move(callback)});
    return id;
}

void FrameQueue::cancelFrame(FrameId id) {
    pending_.erase(
        std::remove_if(pending_.begin(), pending_.end(),
                       [id](const Entry& e) { return e.id == id; }),
        pending_.end());
}

std::size_t FrameQueue::runFrame(Clock::time_point now) {
    // Take the current batch so re-requests from inside a callback
    // land in the next frame.
    std::vector<Entry> batch;
    batch.swap(pending_);

    std::size_t delivered = 0;
    for (auto& entry : batch) {
        if (entry.callback) {
            entry.callback(now);
            ++delivered;
        }
    }
    return delivered;
}

} // namespace blockfall::controller
