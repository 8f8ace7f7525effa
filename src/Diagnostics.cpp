#include "Diagnostics.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace {

bool active(const float* pm, const float* v) {
    return pm[3] > 0.0f &&
           std::isfinite(pm[0]) && std::isfinite(pm[1]) && std::isfinite(pm[2]) && std::isfinite(pm[3]) &&
           std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
}

} // namespace

bool SimulationDiagnostics::operator==(const SimulationDiagnostics& o) const {
    return particle_count == o.particle_count && active_particles == o.active_particles &&
           iteration == o.iteration && total_mass == o.total_mass &&
           center_of_mass == o.center_of_mass && momentum == o.momentum &&
           angular_momentum == o.angular_momentum && kinetic_energy == o.kinetic_energy &&
           potential_energy == o.potential_energy && channels == o.channels && levels == o.levels;
}

std::string SimulationDiagnostics::summary() const {
    std::ostringstream out;
    out << "iteration " << iteration << ": " << active_particles << "/" << particle_count
        << " active, M=" << total_mass
        << ", |p|=" << momentum.norm()
        << ", |L|=" << angular_momentum.norm()
        << ", KE=" << kinetic_energy
        << ", PE=" << potential_energy
        << ", E=" << total_energy();
    return out.str();
}

namespace diagnostics {

const char* channel_name(SimulationDiagnostics::Channel channel) {
    switch (channel) {
        case SimulationDiagnostics::PosX:  return "pos.x";
        case SimulationDiagnostics::PosY:  return "pos.y";
        case SimulationDiagnostics::PosZ:  return "pos.z";
        case SimulationDiagnostics::Mass:  return "mass";
        case SimulationDiagnostics::VelX:  return "vel.x";
        case SimulationDiagnostics::VelY:  return "vel.y";
        case SimulationDiagnostics::VelZ:  return "vel.z";
        case SimulationDiagnostics::Speed: return "speed";
        default:                           return "unknown";
    }
}

SimulationDiagnostics compute(const std::vector<float>& position_mass,
                              const std::vector<float>& velocity,
                              double gravity,
                              double softening,
                              bool include_potential) {
    SimulationDiagnostics d;
    const size_t n = std::min(position_mass.size(), velocity.size()) / 4;
    d.particle_count = n;

    std::array<double, SimulationDiagnostics::ChannelCount> sum{};
    std::array<double, SimulationDiagnostics::ChannelCount> sum_sq{};
    for (auto& c : d.channels) {
        c.min = std::numeric_limits<double>::infinity();
        c.max = -std::numeric_limits<double>::infinity();
    }

    for (size_t i = 0; i < n; ++i) {
        const float* pm = &position_mass[4 * i];
        const float* v = &velocity[4 * i];
        if (!active(pm, v)) continue;
        ++d.active_particles;

        const double m = pm[3];
        const Eigen::Vector3d p(pm[0], pm[1], pm[2]);
        const Eigen::Vector3d vel(v[0], v[1], v[2]);

        d.total_mass += m;
        d.center_of_mass += m * p;
        d.momentum += m * vel;
        d.angular_momentum += m * p.cross(vel);
        d.kinetic_energy += 0.5 * m * vel.squaredNorm();

        const std::array<double, SimulationDiagnostics::ChannelCount> values{
            p.x(), p.y(), p.z(), m, vel.x(), vel.y(), vel.z(), vel.norm()};
        for (int c = 0; c < SimulationDiagnostics::ChannelCount; ++c) {
            sum[c] += values[c];
            sum_sq[c] += values[c] * values[c];
            d.channels[c].min = std::min(d.channels[c].min, values[c]);
            d.channels[c].max = std::max(d.channels[c].max, values[c]);
        }
    }

    if (d.active_particles == 0) {
        for (auto& c : d.channels) c = ChannelStats();
        return d;
    }

    d.center_of_mass /= d.total_mass;
    const double count = static_cast<double>(d.active_particles);
    for (int c = 0; c < SimulationDiagnostics::ChannelCount; ++c) {
        const double mean = sum[c] / count;
        d.channels[c].mean = mean;
        d.channels[c].stddev = std::sqrt(std::max(0.0, sum_sq[c] / count - mean * mean));
    }

    if (include_potential) {
        const double eps2 = softening * softening;
        double pe = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const float* pi = &position_mass[4 * i];
            if (!active(pi, &velocity[4 * i])) continue;
            for (size_t j = i + 1; j < n; ++j) {
                const float* pj = &position_mass[4 * j];
                if (!active(pj, &velocity[4 * j])) continue;
                const double dx = double(pj[0]) - pi[0];
                const double dy = double(pj[1]) - pi[1];
                const double dz = double(pj[2]) - pi[2];
                pe -= double(pi[3]) * pj[3] / std::sqrt(dx * dx + dy * dy + dz * dz + eps2);
            }
        }
        d.potential_energy = gravity * pe;
    }
    return d;
}

std::vector<Eigen::Vector3d> direct_accelerations(const std::vector<float>& position_mass,
                                                  double gravity,
                                                  double softening) {
    const size_t n = position_mass.size() / 4;
    const double eps2 = softening * softening;
    std::vector<Eigen::Vector3d> acc(n, Eigen::Vector3d::Zero());
    for (size_t i = 0; i < n; ++i) {
        if (!(position_mass[4 * i + 3] > 0.0f)) continue;
        const Eigen::Vector3d pi(position_mass[4 * i], position_mass[4 * i + 1], position_mass[4 * i + 2]);
        for (size_t j = 0; j < n; ++j) {
            const double mj = position_mass[4 * j + 3];
            if (j == i || !(mj > 0.0)) continue;
            const Eigen::Vector3d r = Eigen::Vector3d(position_mass[4 * j], position_mass[4 * j + 1],
                                                      position_mass[4 * j + 2]) - pi;
            const double r2 = r.squaredNorm() + eps2;
            acc[i] += gravity * mj / (r2 * std::sqrt(r2)) * r;
        }
    }
    return acc;
}

} // namespace diagnostics
