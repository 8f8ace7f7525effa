#pragma once
#include "Aggregator.h"
#include "Bounds.hpp"
#include "BoundsTracker.h"
#include "Diagnostics.h"
#include "EventSystem.h"
#include "GpuDevice.h"
#include "Integrator.h"
#include "PipelineResources.h"
#include "PyramidReducer.h"
#include "TraversalKernel.h"
#include <Eigen/Dense>
#include <chrono>
#include <memory>
#include <vector>

// Barnes-Hut gravity on a texture pyramid with quadrupole-corrected far field.
// One step: bounds poll -> L0 deposit -> pyramid reduction -> traversal -> kick-drift -> swap.
class QuadrupoleGravity {
public:
    struct Config {
        float theta;                            // opening angle of the MAC
        float dt;
        float gravity;                          // G, folded into the force field
        float softening;                        // epsilon, must be > 0
        float damping;                          // velocity scale (1 - damping) per step
        float max_speed;
        float max_accel;
        geom::AABB3f world_bounds;              // initial box until the first refresh
        int grid_size;                          // finest level, power of two
        int num_levels;                         // 0 = down to the 1x1x1 root
        int slices_per_row;                     // Z-slice tiling of the finest level
        bool enable_quadrupole;
        std::chrono::milliseconds bounds_refresh_interval;
        bool async_bounds_refresh;
        float bounds_margin_fraction;
        float bounds_min_padding;
        int texture_width;                      // particle texture, 0 = derive
        int texture_height;
        bool enable_threading;                  // OpenMP inside passes

        Config()
            : theta(0.5f)
            , dt(1.0f / 60.0f)
            , gravity(0.0003f)
            , softening(0.2f)
            , damping(0.0f)
            , max_speed(2.0f)
            , max_accel(1.0f)
            , world_bounds(Eigen::Vector3f(-4.0f, -4.0f, 0.0f), Eigen::Vector3f(4.0f, 4.0f, 2.0f))
            , grid_size(64)
            , num_levels(7)
            , slices_per_row(8)
            , enable_quadrupole(true)
            , bounds_refresh_interval(10000)
            , async_bounds_refresh(true)
            , bounds_margin_fraction(0.1f)
            , bounds_min_padding(0.5f)
            , texture_width(0)
            , texture_height(0)
            , enable_threading(true)
        {}
    };

    struct PerformanceStats {
        uint64_t steps;
        double last_total_ms;
        double total_ms;
        double last_bounds_ms;
        double last_aggregate_ms;
        double last_reduce_ms;
        double last_traversal_ms;
        double last_integrate_ms;
        TraversalKernel::Counters last_traversal;
        size_t last_suppressed;

        PerformanceStats()
            : steps(0), last_total_ms(0.0), total_ms(0.0), last_bounds_ms(0.0),
              last_aggregate_ms(0.0), last_reduce_ms(0.0), last_traversal_ms(0.0),
              last_integrate_ms(0.0), last_suppressed(0) {}
    };

    /*  position_mass: x, y, z, mass per particle. velocity: vx, vy, vz, pad.
        Throws gpu::CapabilityError, gpu::LinkError, gpu::ResourceError or
        std::invalid_argument; a throwing constructor leaves nothing to step.
    */
    QuadrupoleGravity(EventBus& event_bus,
                      const Config& config,
                      const std::vector<float>& position_mass,
                      const std::vector<float>& velocity,
                      const gpu::Capabilities& caps = gpu::Capabilities{});
    ~QuadrupoleGravity();

    QuadrupoleGravity(const QuadrupoleGravity&) = delete;
    QuadrupoleGravity& operator=(const QuadrupoleGravity&) = delete;

    void step();

    // Releases every texture; later calls do nothing
    void dispose();
    bool is_disposed() const { return disposed_; }

    size_t get_particle_count() const { return particle_count_; }
    size_t get_iteration_count() const { return iteration_count_; }
    const Config& get_config() const { return config_; }

    void set_theta(float theta);
    void set_quadrupole_enabled(bool enabled) { config_.enable_quadrupole = enabled; }

    // Current buffers; the next step() swaps them, so do not hold on to these
    const gpu::Texture2D& position_texture() const;
    const gpu::Texture2D& velocity_texture() const;
    const gpu::Texture2D& force_texture() const;

    // CPU copies, 4 floats per particle
    std::vector<float> read_positions() const;
    std::vector<float> read_velocities() const;
    std::vector<float> read_forces() const;

    Eigen::Vector3f get_position(size_t index) const;
    Eigen::Vector3f get_velocity(size_t index) const;
    Eigen::Vector3f get_force(size_t index) const;
    float get_mass(size_t index) const;

    const geom::AABB3f& world_bounds() const;
    void set_world_bounds(const geom::AABB3f& bounds);
    void request_bounds_refresh();
    const BoundsTracker& bounds_tracker() const;

    // Pure read of the current state; the level occupancy is that of the
    // pyramid built by the last step
    SimulationDiagnostics capture_diagnostics(bool include_potential = true) const;

    const std::vector<LevelConfig>& level_configs() const { return resources_.levels; }
    size_t live_texture_count() const { return device_.arena().live_count(); }

    const PerformanceStats& get_performance_stats() const { return perf_; }
    void print_performance_analysis() const;

private:
    #ifdef GP_TESTING
        friend struct GPTestHooks;
    #endif

    static void validate(const Config& config);
    void require_capabilities() const;
    void ensure_live(const char* operation) const;
    void release_resources();

    std::vector<float> read_texture(gpu::TextureId id) const;
    gpu::Texel fetch_particle(gpu::TextureId id, size_t index) const;

    TraversalKernel::Params traversal_params() const;
    Integrator::Params integrator_params() const;

    EventBus& event_bus_;
    Config config_;
    size_t particle_count_;
    gpu::Device device_;
    PipelineResources resources_;
    std::unique_ptr<Aggregator> aggregator_;
    std::unique_ptr<PyramidReducer> reducer_;
    std::unique_ptr<TraversalKernel> traversal_;
    std::unique_ptr<Integrator> integrator_;
    std::unique_ptr<BoundsTracker> bounds_;
    size_t iteration_count_;
    bool disposed_;
    PerformanceStats perf_;
};
