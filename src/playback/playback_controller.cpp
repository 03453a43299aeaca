/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "playback_controller.hpp"
#include "animation/state_aggregator.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <exception>

namespace vecanim::playback {

    PlaybackController::PlaybackController(Clock& clock, FrameScheduler& scheduler)
        : clock_(clock),
          scheduler_(scheduler),
          quality_(&qualityPreset(QualityMode::Editing)),
          registry_(std::make_shared<ListenerRegistry>()),
          snapshot_(std::make_shared<const PlaybackSnapshot>()) {}

    PlaybackController::~PlaybackController() {
        cancelFrame();
    }

    void PlaybackController::setQuality(const QualityMode mode) {
        quality_ = &qualityPreset(mode);
        LOG_DEBUG("Playback quality set to '{}' ({} Hz)", toString(mode), quality_->update_rate);
    }

    void PlaybackController::setData(std::vector<animation::AnimationRecord> records,
                                     std::span<const animation::CanvasElement> elements) {
        if (disposed_) {
            LOG_WARN("setData() called on a disposed playback controller");
            return;
        }
        records_ = std::move(records);
        elements_ = animation::indexElements(elements);
    }

    void PlaybackController::play() {
        if (disposed_) {
            LOG_WARN("play() called on a disposed playback controller");
            return;
        }
        if (state_ == PlaybackState::Playing) {
            return;
        }

        state_ = PlaybackState::Playing;
        anchor_ms_ = clock_.nowMs() - current_time_ * 1000.0;
        scheduleFrame();
    }

    void PlaybackController::pause() {
        if (state_ != PlaybackState::Playing) {
            return;
        }
        state_ = PlaybackState::Paused;
        cancelFrame();
    }

    void PlaybackController::stop() {
        if (disposed_) {
            return;
        }
        cancelFrame();
        state_ = PlaybackState::Stopped;
        current_time_ = 0.0;
        broadcast(0.0);
    }

    void PlaybackController::seekTo(const double time) {
        if (disposed_) {
            LOG_WARN("seekTo({}) called on a disposed playback controller", time);
            return;
        }
        current_time_ = time;
        if (state_ == PlaybackState::Playing) {
            anchor_ms_ = clock_.nowMs() - time * 1000.0;
        }
        broadcast(time);
    }

    Unsubscribe PlaybackController::subscribe(PlaybackListener listener) {
        const ListenerId id = registry_->next_id++;
        registry_->listeners.emplace_back(id, std::move(listener));

        return [weak = std::weak_ptr<ListenerRegistry>(registry_), id]() {
            const auto registry = weak.lock();
            if (!registry) {
                return;
            }
            auto& listeners = registry->listeners;
            listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                           [id](const auto& p) { return p.first == id; }),
                            listeners.end());
        };
    }

    size_t PlaybackController::listenerCount() const {
        return registry_->listeners.size();
    }

    void PlaybackController::dispose() {
        if (disposed_) {
            return;
        }
        stop();
        disposed_ = true;
        registry_->listeners.clear();
        records_.clear();
        elements_.clear();
        snapshot_ = std::make_shared<const PlaybackSnapshot>();
        LOG_DEBUG("Playback controller disposed");
    }

    void PlaybackController::tick() {
        pending_frame_.reset();
        if (state_ != PlaybackState::Playing) {
            return;
        }

        const double now = clock_.nowMs();
        current_time_ = (now - anchor_ms_) / 1000.0;

        const double min_interval_ms = 1000.0 / static_cast<double>(quality_->update_rate);
        if (!last_broadcast_ms_ || now - *last_broadcast_ms_ >= min_interval_ms) {
            broadcast(current_time_);
            last_broadcast_ms_ = now;
        }

        // A listener may have paused or stopped playback
        if (state_ == PlaybackState::Playing && !pending_frame_) {
            scheduleFrame();
        }
    }

    void PlaybackController::scheduleFrame() {
        if (pending_frame_) {
            return;
        }
        pending_frame_ = scheduler_.requestFrame([this] { tick(); });
    }

    void PlaybackController::cancelFrame() {
        if (pending_frame_) {
            scheduler_.cancelFrame(*pending_frame_);
            pending_frame_.reset();
        }
    }

    void PlaybackController::broadcast(const double time) {
        auto snapshot = std::make_shared<PlaybackSnapshot>();
        snapshot->time = time;
        snapshot->states = animation::calculateAllStates(records_, elements_, time);
        snapshot_ = snapshot;

        // Listeners may unsubscribe or seek while being notified
        const PlaybackSnapshotPtr current = std::move(snapshot);
        const auto listeners = registry_->listeners;
        for (const auto& [id, listener] : listeners) {
            try {
                listener(current);
            } catch (const std::exception& e) {
                LOG_ERROR("Playback listener {} failed: {}", id, e.what());
            } catch (...) {
                LOG_ERROR("Playback listener {} failed: unknown exception", id);
            }
        }
    }

} // namespace vecanim::playback
