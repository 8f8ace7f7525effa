#pragma once
#include "Bounds.hpp"
#include "BoundsReducer.h"
#include "EventSystem.h"
#include "GpuDevice.h"
#include <chrono>
#include <functional>
#include <future>

/*  Holds the world box used to voxelize particles. Refreshes are rate limited
    to one per wall-clock interval; each refresh runs the min/max reduction
    over a snapshot of the position texture, in the background when async is
    enabled. update() never blocks on a running refresh: it adopts a finished
    result and otherwise keeps serving the cached box. A failed refresh is
    logged and the previous box is kept.
*/
class BoundsTracker {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using RefreshJob = std::function<BoundsReducer::Result()>;
    using Launcher = std::function<std::future<BoundsReducer::Result>(RefreshJob)>;

    struct Config {
        std::chrono::milliseconds refresh_interval;
        bool async;
        float margin_fraction;     // padding as a fraction of the extent
        float min_padding;         // lower bound on padding per axis, must be > 0 for planar sets

        Config()
            : refresh_interval(10000)
            , async(true)
            , margin_fraction(0.1f)
            , min_padding(0.5f)
        {}
    };

    BoundsTracker(EventBus& event_bus,
                  const geom::AABB3f& initial,
                  const Config& config = Config{},
                  TimeSource now = TimeSource{});
    ~BoundsTracker();

    BoundsTracker(const BoundsTracker&) = delete;
    BoundsTracker& operator=(const BoundsTracker&) = delete;

    const geom::AABB3f& bounds() const { return bounds_; }

    // Replaces the cached box; a running refresh is discarded
    void set_bounds(const geom::AABB3f& bounds);

    // Forces a refresh at the next update() regardless of the interval
    void request_refresh() { refresh_requested_ = true; }

    // Polls a running refresh and starts a new one when due
    void update(const gpu::Texture2D& positions, size_t particle_count);

    // Blocks until a running refresh has been adopted
    void wait_for_pending();

    bool refresh_pending() const { return pending_.valid(); }
    Clock::time_point last_updated() const { return last_updated_; }
    size_t refresh_count() const { return refresh_count_; }
    size_t failure_count() const { return failure_count_; }
    const Config& config() const { return config_; }

    static geom::AABB3f pad(const geom::AABB3f& raw, float margin_fraction, float min_padding);

private:
    #ifdef GP_TESTING
        friend struct GPTestHooks;
    #endif

    void start_refresh(const gpu::Texture2D& positions, size_t particle_count);
    void adopt(std::future<BoundsReducer::Result>& task);
    void apply(const BoundsReducer::Result& result);
    void record_failure(const std::string& reason);

    EventBus& event_bus_;
    Config config_;
    TimeSource now_;
    Launcher launch_;
    geom::AABB3f bounds_;
    std::future<BoundsReducer::Result> pending_;
    Clock::time_point last_attempt_;
    Clock::time_point last_updated_;
    bool refresh_requested_;
    size_t refresh_count_;
    size_t failure_count_;
};
