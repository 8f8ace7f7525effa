#pragma once

#include "QuadrupoleGravity.h"

#include <random>
#include <string>
#include <vector>

// Initial conditions plus a matching configuration
struct Scenario {
    std::string name;
    std::vector<float> position_mass;   // x, y, z, m
    std::vector<float> velocity;        // vx, vy, vz, 0
    QuadrupoleGravity::Config config;

    size_t particle_count() const { return position_mass.size() / 4; }
    void add_particle(const Eigen::Vector3f& pos, float mass, const Eigen::Vector3f& vel);
};

// Factory for the reference gravitational scenarios
class ScenarioFactory {
public:
    explicit ScenarioFactory(uint32_t seed = 42);

    // Two-body problems
    Scenario binary_orbit(float mass = 1.0f, float semi_major = 1.0f, float gravity = 0.001f);
    Scenario eccentric_binary(float eccentricity = 0.5f);
    Scenario free_fall();
    Scenario escape(float escape_factor = 1.3f);
    Scenario softening_pair(float softening);

    // Many-body distributions
    Scenario uniform_shell(size_t count, float r_min = 0.5f, float r_max = 2.5f);
    Scenario rotating_disk(size_t count, float radius = 2.0f, float omega = 0.1f);
    Scenario plummer_cloud(size_t count, float scale_radius = 1.0f);

    Scenario by_name(const std::string& name, size_t count = 0);
    static std::vector<std::string> names();

    // Relative circular speed of two bodies of total mass M at separation d
    static float circular_speed(float gravity, float total_mass, float separation);
    static float escape_speed(float gravity, float mass, float distance);
    static float orbital_period(float gravity, float total_mass, float semi_major);

private:
    std::mt19937 gen_;

    // Fixed cube bounds, no refresh, a small grid suited to few bodies
    static void configure_few_body(QuadrupoleGravity::Config& cfg, float half_extent);
    static void configure_many_body(QuadrupoleGravity::Config& cfg, float half_extent);
};
