/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation/animation_record.hpp"
#include "animation/canvas_element.hpp"
#include "animation/element_state.hpp"
#include "frame_scheduler.hpp"
#include "quality.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace vecanim::playback {

    enum class PlaybackState : uint8_t { Stopped,
                                         Playing,
                                         Paused };

    // Immutable result of one evaluation, shared with every listener
    struct PlaybackSnapshot {
        double time = 0.0;
        animation::ElementStateMap states;
    };

    using PlaybackSnapshotPtr = std::shared_ptr<const PlaybackSnapshot>;
    using PlaybackListener = std::function<void(const PlaybackSnapshotPtr& snapshot)>;
    using Unsubscribe = std::function<void()>;

    // Drives the evaluator from the host frame loop. Clock and scheduler must outlive the controller.
    // Not thread-safe: every call must come from the frame thread.
    class PlaybackController {
    public:
        PlaybackController(Clock& clock, FrameScheduler& scheduler);
        ~PlaybackController();

        PlaybackController(const PlaybackController&) = delete;
        PlaybackController& operator=(const PlaybackController&) = delete;

        void setQuality(QualityMode mode);
        [[nodiscard]] const QualitySettings& getQuality() const { return *quality_; }

        void setData(std::vector<animation::AnimationRecord> records, std::span<const animation::CanvasElement> elements);

        void play();
        void pause();
        void stop();
        void seekTo(double time);

        [[nodiscard]] double getCurrentTime() const { return current_time_; }
        [[nodiscard]] bool getIsPlaying() const { return state_ == PlaybackState::Playing; }
        [[nodiscard]] PlaybackState getState() const { return state_; }
        [[nodiscard]] bool isDisposed() const { return disposed_; }

        // The returned callable may be invoked any number of times, also after dispose or destruction
        [[nodiscard]] Unsubscribe subscribe(PlaybackListener listener);
        [[nodiscard]] size_t listenerCount() const;

        // States from the last broadcast
        [[nodiscard]] const animation::ElementStateMap& getElementStates() const { return snapshot_->states; }
        [[nodiscard]] PlaybackSnapshotPtr getSnapshot() const { return snapshot_; }

        // Stops playback and drops listeners and data. Terminal.
        void dispose();

    private:
        using ListenerId = uint64_t;

        struct ListenerRegistry {
            std::vector<std::pair<ListenerId, PlaybackListener>> listeners;
            ListenerId next_id = 1;
        };

        void tick();
        void scheduleFrame();
        void cancelFrame();
        void broadcast(double time);

        Clock& clock_;
        FrameScheduler& scheduler_;
        const QualitySettings* quality_;

        std::vector<animation::AnimationRecord> records_;
        animation::ElementIndex elements_;

        std::shared_ptr<ListenerRegistry> registry_;
        PlaybackSnapshotPtr snapshot_;

        PlaybackState state_ = PlaybackState::Stopped;
        double current_time_ = 0.0;
        double anchor_ms_ = 0.0;
        std::optional<double> last_broadcast_ms_;
        std::optional<FrameRequestId> pending_frame_;
        bool disposed_ = false;
    };

} // namespace vecanim::playback
