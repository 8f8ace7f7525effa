#pragma once
#include <Eigen/Dense>
#include <array>
#include <string>
#include <vector>

struct ChannelStats {
    double mean;
    double min;
    double max;
    double stddev;

    ChannelStats() : mean(0.0), min(0.0), max(0.0), stddev(0.0) {}
    bool operator==(const ChannelStats& o) const {
        return mean == o.mean && min == o.min && max == o.max && stddev == o.stddev;
    }
};

struct LevelOccupancy {
    int level;
    int grid_size;
    size_t occupied_cells;
    double total_mass;

    bool operator==(const LevelOccupancy& o) const {
        return level == o.level && grid_size == o.grid_size &&
               occupied_cells == o.occupied_cells && total_mass == o.total_mass;
    }
};

// Read-only picture of the simulation between two steps
struct SimulationDiagnostics {
    enum Channel { PosX, PosY, PosZ, Mass, VelX, VelY, VelZ, Speed, ChannelCount };

    size_t particle_count;
    size_t active_particles;          // finite state and mass > 0
    size_t iteration;
    double total_mass;
    Eigen::Vector3d center_of_mass;
    Eigen::Vector3d momentum;
    Eigen::Vector3d angular_momentum; // about the origin
    double kinetic_energy;
    double potential_energy;          // softened pairwise sum, 0 when skipped
    std::array<ChannelStats, ChannelCount> channels;
    std::vector<LevelOccupancy> levels;

    SimulationDiagnostics()
        : particle_count(0), active_particles(0), iteration(0), total_mass(0.0),
          center_of_mass(Eigen::Vector3d::Zero()), momentum(Eigen::Vector3d::Zero()),
          angular_momentum(Eigen::Vector3d::Zero()), kinetic_energy(0.0), potential_energy(0.0) {}

    double total_energy() const { return kinetic_energy + potential_energy; }

    bool operator==(const SimulationDiagnostics& o) const;
    bool operator!=(const SimulationDiagnostics& o) const { return !(*this == o); }

    std::string summary() const;
};

namespace diagnostics {

const char* channel_name(SimulationDiagnostics::Channel channel);

/*  Conserved quantities and per-channel statistics of flat particle arrays
    (4 floats per particle). Inactive particles are excluded. The potential
    is -G Σ_{i<j} m_i m_j / sqrt(r² + ε²), an O(N²) sum skipped when
    include_potential is false.
*/
SimulationDiagnostics compute(const std::vector<float>& position_mass,
                              const std::vector<float>& velocity,
                              double gravity,
                              double softening,
                              bool include_potential = true);

// Softened direct-sum accelerations, double precision. Used as the reference
// solution in accuracy tests and benchmarks.
std::vector<Eigen::Vector3d> direct_accelerations(const std::vector<float>& position_mass,
                                                  double gravity,
                                                  double softening);

} // namespace diagnostics
