#include "BoundsTracker.h"
#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

BoundsTracker::BoundsTracker(EventBus& event_bus,
                             const geom::AABB3f& initial,
                             const Config& config,
                             TimeSource now)
    : event_bus_(event_bus), config_(config),
      now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })),
      launch_([](RefreshJob job) { return std::async(std::launch::async, std::move(job)); }),
      bounds_(initial), refresh_requested_(false),
      refresh_count_(0), failure_count_(0) {
    if (!initial.valid()) {
        throw std::invalid_argument("initial world bounds must be finite with max > min on every axis");
    }
    last_attempt_ = now_();
    last_updated_ = last_attempt_;
}

BoundsTracker::~BoundsTracker() {
    // The task only touches its own snapshot; waiting keeps it from outliving us
    if (pending_.valid()) pending_.wait();
}

geom::AABB3f BoundsTracker::pad(const geom::AABB3f& raw, float margin_fraction, float min_padding) {
    const Eigen::Vector3f extent = raw.extent();
    Eigen::Vector3f padding;
    for (int a = 0; a < 3; ++a) {
        padding[a] = std::max(min_padding, margin_fraction * extent[a]);
    }
    return geom::AABB3f(raw.min - padding, raw.max + padding);
}

void BoundsTracker::set_bounds(const geom::AABB3f& bounds) {
    if (!bounds.valid()) {
        throw std::invalid_argument("world bounds must be finite with max > min on every axis");
    }
    if (pending_.valid()) {
        pending_.wait();
        pending_ = std::future<BoundsReducer::Result>();
    }
    bounds_ = bounds;
    last_updated_ = now_();
}

void BoundsTracker::update(const gpu::Texture2D& positions, size_t particle_count) {
    if (pending_.valid() &&
        pending_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        adopt(pending_);
    }
    if (pending_.valid()) return;

    const Clock::time_point now = now_();
    if (!refresh_requested_ && now - last_attempt_ < config_.refresh_interval) return;

    refresh_requested_ = false;
    last_attempt_ = now;
    start_refresh(positions, particle_count);
}

void BoundsTracker::wait_for_pending() {
    if (pending_.valid()) {
        pending_.wait();
        adopt(pending_);
    }
}

void BoundsTracker::start_refresh(const gpu::Texture2D& positions, size_t particle_count) {
    if (!config_.async) {
        try {
            BoundsReducer reducer;
            apply(reducer.reduce(positions, particle_count));
        } catch (const std::exception& e) {
            record_failure(e.what());
        }
        return;
    }

    // Readback copy: the pipeline keeps writing its textures while this runs
    try {
        auto snapshot = std::make_shared<const gpu::Texture2D>(positions);
        pending_ = launch_([snapshot, particle_count] {
            BoundsReducer reducer;
            return reducer.reduce(*snapshot, particle_count);
        });
    } catch (const std::exception& e) {
        record_failure(std::string("could not start background refresh: ") + e.what());
    }
}

void BoundsTracker::adopt(std::future<BoundsReducer::Result>& task) {
    try {
        apply(task.get());
    } catch (const std::exception& e) {
        record_failure(e.what());
    }
}

void BoundsTracker::apply(const BoundsReducer::Result& result) {
    if (!result.ok) {
        record_failure(result.error);
        return;
    }
    const geom::AABB3f padded = pad(result.raw, config_.margin_fraction, config_.min_padding);
    if (!padded.valid()) {
        // A flat particle set with no minimum padding leaves an axis without extent
        record_failure("refreshed bounds are degenerate on at least one axis");
        return;
    }
    bounds_ = padded;
    last_updated_ = now_();
    ++refresh_count_;

    BoundsUpdatedEvent event{bounds_.min.x(), bounds_.min.y(), bounds_.min.z(),
                             bounds_.max.x(), bounds_.max.y(), bounds_.max.z(),
                             result.valid_particles, refresh_count_};
    event_bus_.emit(Events::BOUNDS_UPDATED, event);
}

void BoundsTracker::record_failure(const std::string& reason) {
    ++failure_count_;
    std::cerr << "World bounds refresh failed (" << reason << "); keeping previous bounds ["
              << bounds_.min.transpose() << "] .. [" << bounds_.max.transpose() << "]\n";
    event_bus_.emit(Events::BOUNDS_REFRESH_FAILED, BoundsRefreshFailedEvent{reason, failure_count_});
}
