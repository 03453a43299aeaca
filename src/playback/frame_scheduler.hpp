/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace vecanim::playback {

    // Monotonic time source in milliseconds
    class Clock {
    public:
        virtual ~Clock() = default;
        [[nodiscard]] virtual double nowMs() const = 0;
    };

    class SteadyClock final : public Clock {
    public:
        SteadyClock();
        [[nodiscard]] double nowMs() const override;

    private:
        std::chrono::steady_clock::time_point origin_;
    };

    // Time only moves when told to
    class ManualClock final : public Clock {
    public:
        explicit ManualClock(const double start_ms = 0.0) : now_ms_(start_ms) {}

        [[nodiscard]] double nowMs() const override { return now_ms_; }
        void set(const double ms) { now_ms_ = ms; }
        void advance(const double ms) { now_ms_ += ms; }

    private:
        double now_ms_;
    };

    using FrameRequestId = uint64_t;
    using FrameCallback = std::function<void()>;

    // Host hook for "call me before the next frame". A request fires at most once.
    class FrameScheduler {
    public:
        virtual ~FrameScheduler() = default;

        virtual FrameRequestId requestFrame(FrameCallback callback) = 0;
        virtual void cancelFrame(FrameRequestId id) = 0;
    };

    // Frames are pumped by the owner of the render loop via runFrame()
    class ManualFrameScheduler final : public FrameScheduler {
    public:
        FrameRequestId requestFrame(FrameCallback callback) override;
        void cancelFrame(FrameRequestId id) override;

        // Runs the callbacks pending at call time. Requests made while running wait for the next frame.
        // Returns the number of callbacks invoked. An exception from a callback propagates after the
        // callbacks behind it are put back in the queue for the next frame.
        size_t runFrame();

        [[nodiscard]] size_t pendingCount() const { return pending_.size(); }
        [[nodiscard]] bool hasPendingFrame() const { return !pending_.empty(); }

    private:
        std::vector<std::pair<FrameRequestId, FrameCallback>> pending_;
        FrameRequestId next_id_ = 1;
    };

} // namespace vecanim::playback
