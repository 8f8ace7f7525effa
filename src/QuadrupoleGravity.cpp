#include "QuadrupoleGravity.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

using Ms = std::chrono::duration<double, std::milli>;

size_t particle_count_of(const std::vector<float>& position_mass) {
    if (position_mass.empty() || position_mass.size() % 4 != 0) {
        throw std::invalid_argument("position/mass array must hold 4 floats per particle, got " +
                                    std::to_string(position_mass.size()) + " floats");
    }
    return position_mass.size() / 4;
}

} // namespace

QuadrupoleGravity::QuadrupoleGravity(EventBus& event_bus,
                                     const Config& config,
                                     const std::vector<float>& position_mass,
                                     const std::vector<float>& velocity,
                                     const gpu::Capabilities& caps)
    : event_bus_(event_bus), config_(config),
      particle_count_(particle_count_of(position_mass)),
      device_(caps, config.enable_threading),
      iteration_count_(0), disposed_(false) {

    validate(config_);
    const std::vector<LevelConfig> levels =
        build_level_configs(config_.grid_size, config_.slices_per_row, config_.num_levels);
    resources_.levels = levels;
    require_capabilities();

    // Kernels link before any texture exists, so a link failure allocates nothing
    aggregator_ = std::make_unique<Aggregator>(device_);
    reducer_    = std::make_unique<PyramidReducer>(device_);
    traversal_  = std::make_unique<TraversalKernel>(device_, levels.size());
    integrator_ = std::make_unique<Integrator>(device_);

    const ParticleLayout layout =
        ParticleLayout::for_count(particle_count_, config_.texture_width, config_.texture_height);
    resources_.allocate(device_.arena(), layout, levels);
    resources_.particles.upload(device_.arena(), position_mass, velocity);

    BoundsTracker::Config bounds_cfg;
    bounds_cfg.refresh_interval = config_.bounds_refresh_interval;
    bounds_cfg.async = config_.async_bounds_refresh;
    bounds_cfg.margin_fraction = config_.bounds_margin_fraction;
    bounds_cfg.min_padding = config_.bounds_min_padding;
    bounds_ = std::make_unique<BoundsTracker>(event_bus_, config_.world_bounds, bounds_cfg);

    std::cout << "QuadrupoleGravity initialized with " << particle_count_ << " particles ("
              << layout.width << "x" << layout.height << " texels), grid "
              << config_.grid_size << "^3, " << levels.size() << " levels, "
              << device_.arena().live_count() << " textures, "
              << std::fixed << std::setprecision(2)
              << device_.arena().bytes_allocated() / (1024.0 * 1024.0) << " MB\n"
              << std::defaultfloat;

    #ifdef _OPENMP
        if (config_.enable_threading) {
            std::cout << "OpenMP threading enabled with " << omp_get_max_threads() << " threads\n";
        }
    #endif
}

QuadrupoleGravity::~QuadrupoleGravity() {
    release_resources();
}

void QuadrupoleGravity::validate(const Config& c) {
    auto fail = [](const std::string& what) {
        throw std::invalid_argument("QuadrupoleGravity config: " + what);
    };
    if (!(c.theta > 0.0f) || !std::isfinite(c.theta)) fail("theta must be > 0");
    if (!(c.dt > 0.0f) || !std::isfinite(c.dt)) fail("dt must be > 0");
    if (!std::isfinite(c.gravity)) fail("gravity must be finite");
    if (!(c.softening > 0.0f) || !std::isfinite(c.softening)) fail("softening must be > 0");
    if (!(c.damping >= 0.0f && c.damping < 1.0f)) fail("damping must lie in [0, 1)");
    if (!(c.max_speed > 0.0f)) fail("max_speed must be > 0");
    if (!(c.max_accel > 0.0f)) fail("max_accel must be > 0");
    if (!c.world_bounds.valid()) fail("world bounds must be finite with max > min");
    if (c.bounds_refresh_interval.count() < 0) fail("bounds refresh interval must be >= 0");
    if (!(c.bounds_margin_fraction >= 0.0f)) fail("bounds margin fraction must be >= 0");
    if (!(c.bounds_min_padding > 0.0f) || !std::isfinite(c.bounds_min_padding)) {
        fail("bounds minimum padding must be > 0");
    }
}

void QuadrupoleGravity::require_capabilities() const {
    device_.require_float_pipeline();

    const gpu::Capabilities& caps = device_.caps();
    if (caps.max_draw_buffers < 3) {
        throw gpu::CapabilityError("moment pyramid needs 3 draw buffers, device has " +
                                   std::to_string(caps.max_draw_buffers));
    }
    const int bindings = std::max(8, resources_.traversal_bindings());
    if (caps.max_texture_bindings < bindings) {
        throw gpu::CapabilityError("traversal needs " + std::to_string(bindings) +
                                   " bindable textures, device has " +
                                   std::to_string(caps.max_texture_bindings));
    }
}

void QuadrupoleGravity::ensure_live(const char* operation) const {
    if (disposed_) {
        throw std::logic_error(std::string("QuadrupoleGravity::") + operation + " after dispose()");
    }
}

void QuadrupoleGravity::set_theta(float theta) {
    if (!(theta > 0.0f) || !std::isfinite(theta)) {
        throw std::invalid_argument("theta must be > 0");
    }
    config_.theta = theta;
}

TraversalKernel::Params QuadrupoleGravity::traversal_params() const {
    TraversalKernel::Params p;
    p.theta = config_.theta;
    p.softening = config_.softening;
    p.gravity = config_.gravity;
    p.enable_quadrupole = config_.enable_quadrupole;
    return p;
}

Integrator::Params QuadrupoleGravity::integrator_params() const {
    Integrator::Params p;
    p.dt = config_.dt;
    p.damping = config_.damping;
    p.max_speed = config_.max_speed;
    p.max_accel = config_.max_accel;
    return p;
}

//===========================================================================================
//==                                        STEP                                           ==
//===========================================================================================

void QuadrupoleGravity::step() {
    ensure_live("step");
    using clock = std::chrono::high_resolution_clock;
    const auto t0 = clock::now();

    bounds_->update(device_.arena().texture(resources_.particles.position()), particle_count_);
    const geom::AABB3f bounds = bounds_->bounds();
    const auto t1 = clock::now();

    aggregator_->run(resources_, bounds);
    const auto t2 = clock::now();

    reducer_->run(resources_);
    const auto t3 = clock::now();

    traversal_->run(resources_, bounds, traversal_params());
    const auto t4 = clock::now();

    integrator_->run(resources_, integrator_params());
    const auto t5 = clock::now();

    ++iteration_count_;
    perf_.steps = iteration_count_;
    perf_.last_bounds_ms = Ms(t1 - t0).count();
    perf_.last_aggregate_ms = Ms(t2 - t1).count();
    perf_.last_reduce_ms = Ms(t3 - t2).count();
    perf_.last_traversal_ms = Ms(t4 - t3).count();
    perf_.last_integrate_ms = Ms(t5 - t4).count();
    perf_.last_total_ms = Ms(t5 - t0).count();
    perf_.total_ms += perf_.last_total_ms;
    perf_.last_traversal = traversal_->last_counters();
    perf_.last_suppressed = integrator_->last_suppressed();

    PhysicsUpdateEvent event{config_.dt, particle_count_, iteration_count_};
    event_bus_.emit(Events::PHYSICS_UPDATE, event);
}

//===========================================================================================
//==                                      LIFETIME                                         ==
//===========================================================================================

void QuadrupoleGravity::release_resources() {
    bounds_.reset();
    if (resources_.allocated()) {
        resources_.release(device_.arena());
    }
    device_.arena().release_all();
}

void QuadrupoleGravity::dispose() {
    if (disposed_) return;
    const size_t live = device_.arena().live_count();
    release_resources();
    disposed_ = true;

    std::cout << "QuadrupoleGravity disposed after " << iteration_count_ << " steps, released "
              << live << " textures\n";
    event_bus_.emit(Events::SIMULATION_DISPOSED, SimulationDisposedEvent{iteration_count_, live});
}

//===========================================================================================
//==                                     READ-BACK                                         ==
//===========================================================================================

const gpu::Texture2D& QuadrupoleGravity::position_texture() const {
    ensure_live("position_texture");
    return device_.arena().texture(resources_.particles.position());
}

const gpu::Texture2D& QuadrupoleGravity::velocity_texture() const {
    ensure_live("velocity_texture");
    return device_.arena().texture(resources_.particles.velocity());
}

const gpu::Texture2D& QuadrupoleGravity::force_texture() const {
    ensure_live("force_texture");
    return device_.arena().texture(resources_.force);
}

std::vector<float> QuadrupoleGravity::read_texture(gpu::TextureId id) const {
    const gpu::Texture2D& tex = device_.arena().texture(id);
    const ParticleLayout& layout = resources_.particles.layout();
    std::vector<float> out(particle_count_ * 4);
    for (size_t i = 0; i < particle_count_; ++i) {
        const Eigen::Vector2i t = layout.texel_of(i);
        const gpu::Texel& v = tex.fetch(t.x(), t.y());
        out[4 * i]     = v.x();
        out[4 * i + 1] = v.y();
        out[4 * i + 2] = v.z();
        out[4 * i + 3] = v.w();
    }
    return out;
}

std::vector<float> QuadrupoleGravity::read_positions() const {
    ensure_live("read_positions");
    return read_texture(resources_.particles.position());
}

std::vector<float> QuadrupoleGravity::read_velocities() const {
    ensure_live("read_velocities");
    return read_texture(resources_.particles.velocity());
}

std::vector<float> QuadrupoleGravity::read_forces() const {
    ensure_live("read_forces");
    return read_texture(resources_.force);
}

gpu::Texel QuadrupoleGravity::fetch_particle(gpu::TextureId id, size_t index) const {
    if (index >= particle_count_) {
        throw std::out_of_range("particle index " + std::to_string(index) + " out of range");
    }
    const Eigen::Vector2i t = resources_.particles.layout().texel_of(index);
    return device_.arena().texture(id).fetch(t.x(), t.y());
}

Eigen::Vector3f QuadrupoleGravity::get_position(size_t index) const {
    ensure_live("get_position");
    return fetch_particle(resources_.particles.position(), index).head<3>();
}

Eigen::Vector3f QuadrupoleGravity::get_velocity(size_t index) const {
    ensure_live("get_velocity");
    return fetch_particle(resources_.particles.velocity(), index).head<3>();
}

Eigen::Vector3f QuadrupoleGravity::get_force(size_t index) const {
    ensure_live("get_force");
    return fetch_particle(resources_.force, index).head<3>();
}

float QuadrupoleGravity::get_mass(size_t index) const {
    ensure_live("get_mass");
    return fetch_particle(resources_.particles.position(), index).w();
}

const geom::AABB3f& QuadrupoleGravity::world_bounds() const {
    ensure_live("world_bounds");
    return bounds_->bounds();
}

void QuadrupoleGravity::set_world_bounds(const geom::AABB3f& bounds) {
    ensure_live("set_world_bounds");
    bounds_->set_bounds(bounds);
}

void QuadrupoleGravity::request_bounds_refresh() {
    ensure_live("request_bounds_refresh");
    bounds_->request_refresh();
}

const BoundsTracker& QuadrupoleGravity::bounds_tracker() const {
    ensure_live("bounds_tracker");
    return *bounds_;
}

//===========================================================================================
//==                                    DIAGNOSTICS                                        ==
//===========================================================================================

SimulationDiagnostics QuadrupoleGravity::capture_diagnostics(bool include_potential) const {
    ensure_live("capture_diagnostics");
    SimulationDiagnostics d = diagnostics::compute(read_positions(), read_velocities(),
                                                   config_.gravity, config_.softening,
                                                   include_potential);
    d.iteration = iteration_count_;

    for (size_t k = 0; k < resources_.levels.size(); ++k) {
        const LevelConfig& cfg = resources_.levels[k];
        const gpu::Texture2D& a0 = device_.arena().texture(resources_.level_textures[k].a0);
        LevelOccupancy occ{static_cast<int>(k), cfg.grid_size, 0, 0.0};
        for (int ty = 0; ty < cfg.texture_height; ++ty) {
            for (int tx = 0; tx < cfg.texture_width; ++tx) {
                const float m = a0.fetch(tx, ty).w();
                if (m > 0.0f) {
                    ++occ.occupied_cells;
                    occ.total_mass += m;
                }
            }
        }
        d.levels.push_back(occ);
    }
    return d;
}

void QuadrupoleGravity::print_performance_analysis() const {
    const PerformanceStats& p = perf_;
    const double avg = p.steps > 0 ? p.total_ms / static_cast<double>(p.steps) : 0.0;
    const double per_particle = particle_count_ > 0
        ? static_cast<double>(p.last_traversal.cells_tested) / static_cast<double>(particle_count_)
        : 0.0;

    std::cout << "\n=== QuadrupoleGravity performance ===\n";
    std::cout << "Particles: " << particle_count_ << ", steps: " << p.steps
              << ", grid " << config_.grid_size << "^3, theta " << config_.theta
              << (config_.enable_quadrupole ? ", quadrupole" : ", monopole") << "\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Last step: " << p.last_total_ms << " ms (avg " << avg << " ms)\n";
    std::cout << "  bounds     " << p.last_bounds_ms << " ms\n";
    std::cout << "  aggregate  " << p.last_aggregate_ms << " ms\n";
    std::cout << "  reduce     " << p.last_reduce_ms << " ms\n";
    std::cout << "  traversal  " << p.last_traversal_ms << " ms\n";
    std::cout << "  integrate  " << p.last_integrate_ms << " ms\n";
    std::cout << std::defaultfloat;
    std::cout << "Traversal: " << p.last_traversal.cells_tested << " cells tested ("
              << per_particle << " per particle), " << p.last_traversal.far_field_cells
              << " far-field, " << p.last_traversal.near_field_cells << " near-field\n";
    std::cout << "Suppressed particle updates: " << p.last_suppressed << "\n";
    if (!disposed_) {
        const BoundsTracker& b = *bounds_;
        std::cout << "Bounds: [" << b.bounds().min.transpose() << "] .. [" << b.bounds().max.transpose()
                  << "], " << b.refresh_count() << " refreshes, " << b.failure_count() << " failures\n";
    }
}
