/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "frame_scheduler.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace vecanim::playback {

    SteadyClock::SteadyClock() : origin_(std::chrono::steady_clock::now()) {}

    double SteadyClock::nowMs() const {
        const auto elapsed = std::chrono::steady_clock::now() - origin_;
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }

    FrameRequestId ManualFrameScheduler::requestFrame(FrameCallback callback) {
        const FrameRequestId id = next_id_++;
        pending_.emplace_back(id, std::move(callback));
        return id;
    }

    void ManualFrameScheduler::cancelFrame(const FrameRequestId id) {
        pending_.erase(std::remove_if(pending_.begin(), pending_.end(), [id](const auto& p) { return p.first == id; }),
                       pending_.end());
    }

    size_t ManualFrameScheduler::runFrame() {
        auto frame = std::move(pending_);
        pending_.clear();
        for (size_t i = 0; i < frame.size(); ++i) {
            try {
                frame[i].second();
            } catch (...) {
                // Callbacks that have not run yet stay queued ahead of requests made during this frame
                pending_.insert(pending_.begin(), std::make_move_iterator(frame.begin() + static_cast<std::ptrdiff_t>(i) + 1),
                                std::make_move_iterator(frame.end()));
                throw;
            }
        }
        return frame.size();
    }

} // namespace vecanim::playback
