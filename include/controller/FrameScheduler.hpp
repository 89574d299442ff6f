#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace blockfall::controller {

using Clock = std::chrono::steady_clock;

// Host-side scheduling seam: one-shot callbacks delivered on the host's
// next display refresh or timer tick.
class IFrameScheduler {
public:
    using FrameId = std::uint64_t;
    using FrameCallback = std::function<void(Clock::time_point)>;

    virtual ~IFrameScheduler() = default;

    // Queue `callback` for the next frame.
    virtual FrameId requestFrame(FrameCallback callback) = 0;

    // Drop a queued callback. Unknown or already delivered ids are ignored.
    virtual void cancelFrame(FrameId id) = 0;
};

/// Scheduler driven by the host's own loop: the host calls runFrame()
/// once per refresh. Single-threaded.
class FrameQueue final : public IFrameScheduler {
public:
    FrameId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameId id) override;

    // Deliver every callback queued before this call.
    // Callbacks requested while delivering wait for the next runFrame().
    // Returns the number of callbacks delivered.
    std::size_t runFrame(Clock::time_point now);

    std::size_t pending() const noexcept { return pending_.size(); }

private:
    struct Entry {
        FrameId id;
        FrameCallback callback;
    };

    std::vector<Entry> pending_;
    FrameId nextId_{1};
};

} // namespace blockfall::controller
