#include "ScenarioFactory.h"
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace {
constexpr float kPi = 3.14159265358979323846f;
}

void Scenario::add_particle(const Eigen::Vector3f& pos, float mass, const Eigen::Vector3f& vel) {
    position_mass.insert(position_mass.end(), {pos.x(), pos.y(), pos.z(), mass});
    velocity.insert(velocity.end(), {vel.x(), vel.y(), vel.z(), 0.0f});
}

ScenarioFactory::ScenarioFactory(uint32_t seed) : gen_(seed) {}

float ScenarioFactory::circular_speed(float gravity, float total_mass, float separation) {
    return std::sqrt(gravity * total_mass / separation);
}

float ScenarioFactory::escape_speed(float gravity, float mass, float distance) {
    return std::sqrt(2.0f * gravity * mass / distance);
}

float ScenarioFactory::orbital_period(float gravity, float total_mass, float semi_major) {
    return 2.0f * kPi * std::sqrt(semi_major * semi_major * semi_major / (gravity * total_mass));
}

void ScenarioFactory::configure_few_body(QuadrupoleGravity::Config& cfg, float half_extent) {
    cfg.world_bounds = geom::AABB3f(Eigen::Vector3f::Constant(-half_extent),
                                    Eigen::Vector3f::Constant(half_extent));
    cfg.grid_size = 16;
    cfg.num_levels = 0;
    cfg.slices_per_row = 4;
    cfg.async_bounds_refresh = false;
    cfg.bounds_refresh_interval = std::chrono::hours(24);
    cfg.enable_threading = false;
}

void ScenarioFactory::configure_many_body(QuadrupoleGravity::Config& cfg, float half_extent) {
    configure_few_body(cfg, half_extent);
    cfg.grid_size = 32;
    cfg.enable_threading = true;
}

//===========================================================================================
//==                                   TWO-BODY SETUPS                                     ==
//===========================================================================================

Scenario ScenarioFactory::binary_orbit(float mass, float semi_major, float gravity) {
    /* Equal masses at +-a on the x axis. v is the relative circular speed
       sqrt(G * 2m / 2a); each body carries half of it, in opposite senses.
    */
    Scenario s;
    s.name = "binary";
    const float v = circular_speed(gravity, 2.0f * mass, 2.0f * semi_major);
    s.add_particle({-semi_major, 0.0f, 0.0f}, mass, {0.0f,  0.5f * v, 0.0f});
    s.add_particle({ semi_major, 0.0f, 0.0f}, mass, {0.0f, -0.5f * v, 0.0f});

    configure_few_body(s.config, 3.0f);
    s.config.gravity = gravity;
    s.config.softening = 0.05f;
    s.config.dt = 0.02f;
    return s;
}

Scenario ScenarioFactory::eccentric_binary(float eccentricity) {
    // Starts at periapse: separation 1, relative semi-major axis 1 / (1 - e)
    Scenario s;
    s.name = "eccentric";
    const float mass = 1.0f;
    const float gravity = 0.001f;
    const float rp = 0.5f;
    const float semi_major = 2.0f * rp / (1.0f - eccentricity);
    const float vp = std::sqrt(gravity * 2.0f * mass * (1.0f + eccentricity) / (semi_major * (1.0f - eccentricity)));
    s.add_particle({-rp, 0.0f, 0.0f}, mass, {0.0f,  0.5f * vp, 0.0f});
    s.add_particle({ rp, 0.0f, 0.0f}, mass, {0.0f, -0.5f * vp, 0.0f});

    configure_few_body(s.config, 4.0f);
    s.config.gravity = gravity;
    s.config.softening = 0.05f;
    s.config.dt = 0.02f;
    return s;
}

Scenario ScenarioFactory::free_fall() {
    Scenario s;
    s.name = "freefall";
    s.add_particle({0.0f, 0.0f, 0.0f}, 100.0f, Eigen::Vector3f::Zero());
    s.add_particle({3.0f, 0.0f, 0.0f}, 0.01f, Eigen::Vector3f::Zero());

    configure_few_body(s.config, 4.0f);
    s.config.gravity = 0.001f;
    s.config.softening = 0.1f;
    s.config.dt = 0.005f;
    return s;
}

Scenario ScenarioFactory::escape(float escape_factor) {
    Scenario s;
    s.name = "escape";
    const float heavy = 100.0f;
    const float gravity = 0.001f;
    const float r0 = 1.0f;
    const float v = escape_factor * escape_speed(gravity, heavy, r0);
    s.add_particle({0.0f, 0.0f, 0.0f}, heavy, Eigen::Vector3f::Zero());
    s.add_particle({r0, 0.0f, 0.0f}, 0.1f, {0.0f, v, 0.0f});

    configure_few_body(s.config, 5.0f);
    s.config.gravity = gravity;
    s.config.softening = 0.1f;
    s.config.dt = 0.05f;
    return s;
}

Scenario ScenarioFactory::softening_pair(float softening) {
    // Head-on pair: the bodies pass through each other near t = 2.5
    Scenario s;
    s.name = "softening";
    s.add_particle({-0.5f, 0.0f, 0.0f}, 1.0f, { 0.2f, 0.0f, 0.0f});
    s.add_particle({ 0.5f, 0.0f, 0.0f}, 1.0f, {-0.2f, 0.0f, 0.0f});

    configure_few_body(s.config, 3.0f);
    s.config.gravity = 0.001f;
    s.config.softening = softening;
    s.config.dt = 0.005f;
    s.config.max_speed = 10.0f;
    return s;
}

//===========================================================================================
//==                                 MANY-BODY SETUPS                                      ==
//===========================================================================================

Scenario ScenarioFactory::uniform_shell(size_t count, float r_min, float r_max) {
    Scenario s;
    s.name = "shell";
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    for (size_t i = 0; i < count; ++i) {
        const float cos_t = 2.0f * unit(gen_) - 1.0f;
        const float sin_t = std::sqrt(std::max(0.0f, 1.0f - cos_t * cos_t));
        const float phi = 2.0f * kPi * unit(gen_);
        const float r = r_min + (r_max - r_min) * unit(gen_);
        s.add_particle({r * sin_t * std::cos(phi), r * sin_t * std::sin(phi), r * cos_t},
                       1.0f, Eigen::Vector3f::Zero());
    }

    configure_many_body(s.config, r_max + 1.0f);
    s.config.gravity = 0.0003f;
    s.config.softening = 0.15f;
    s.config.dt = 0.01f;
    return s;
}

Scenario ScenarioFactory::rotating_disk(size_t count, float radius, float omega) {
    // Rigid rotation about +z, uniform surface density in the z = 0 plane
    Scenario s;
    s.name = "disk";
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    for (size_t i = 0; i < count; ++i) {
        const float r = radius * std::sqrt(unit(gen_));
        const float phi = 2.0f * kPi * unit(gen_);
        const Eigen::Vector3f p(r * std::cos(phi), r * std::sin(phi), 0.0f);
        s.add_particle(p, 1.0f, {-omega * p.y(), omega * p.x(), 0.0f});
    }

    configure_many_body(s.config, radius + 1.0f);
    s.config.gravity = 0.0003f;
    s.config.softening = 0.15f;
    s.config.dt = 0.01f;
    return s;
}

Scenario ScenarioFactory::plummer_cloud(size_t count, float scale_radius) {
    /* Plummer sphere positions (inverse-CDF radius, isotropic direction),
       total mass 1, at rest. Radii are capped at 10 scale radii.
    */
    Scenario s;
    s.name = "plummer";
    std::uniform_real_distribution<float> unit(1e-4f, 0.999f);
    const float m = 1.0f / static_cast<float>(std::max<size_t>(count, 1));
    for (size_t i = 0; i < count; ++i) {
        const float x = unit(gen_);
        const float r = std::min(10.0f * scale_radius,
                                 scale_radius / std::sqrt(std::pow(x, -2.0f / 3.0f) - 1.0f));
        const float cos_t = 2.0f * unit(gen_) - 1.0f;
        const float sin_t = std::sqrt(std::max(0.0f, 1.0f - cos_t * cos_t));
        const float phi = 2.0f * kPi * unit(gen_);
        s.add_particle({r * sin_t * std::cos(phi), r * sin_t * std::sin(phi), r * cos_t},
                       m, Eigen::Vector3f::Zero());
    }

    s.config.world_bounds = geom::AABB3f(Eigen::Vector3f::Constant(-10.5f * scale_radius),
                                         Eigen::Vector3f::Constant(10.5f * scale_radius));
    s.config.gravity = 1.0f;
    s.config.softening = 0.05f * scale_radius;
    s.config.dt = 0.005f;
    return s;
}

Scenario ScenarioFactory::by_name(const std::string& name, size_t count) {
    if (name == "binary")    return binary_orbit();
    if (name == "eccentric") return eccentric_binary();
    if (name == "freefall")  return free_fall();
    if (name == "escape")    return escape();
    if (name == "softening") return softening_pair(0.1f);
    if (name == "shell")     return uniform_shell(count > 0 ? count : 50);
    if (name == "disk")      return rotating_disk(count > 0 ? count : 20);
    if (name == "plummer")   return plummer_cloud(count > 0 ? count : 4096);
    throw std::invalid_argument("unknown scenario '" + name + "'");
}

std::vector<std::string> ScenarioFactory::names() {
    return {"binary", "eccentric", "freefall", "escape", "softening", "shell", "disk", "plummer"};
}
