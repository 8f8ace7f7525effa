#pragma once
#include "GpuDevice.h"
#include <array>
#include <vector>

// Row-major particle index <-> texel mapping shared by every per-particle texture
struct ParticleLayout {
    size_t count;
    int width;
    int height;

    ParticleLayout() : count(0), width(1), height(1) {}

    // width/height of 0 pick ceil(sqrt(count)) x ceil(count / width)
    static ParticleLayout for_count(size_t count, int width = 0, int height = 0);

    Eigen::Vector2i texel_of(size_t index) const {
        return Eigen::Vector2i(static_cast<int>(index % width), static_cast<int>(index / width));
    }
    size_t index_of(int x, int y) const {
        return static_cast<size_t>(y) * width + static_cast<size_t>(x);
    }
    size_t texel_count() const { return static_cast<size_t>(width) * height; }
};

/*  Ping-pong particle state. The "current" pair is what every pass reads;
    the integrator writes the "target" pair and swap() flips roles.
    Position texels hold (x, y, z, mass), velocity texels (vx, vy, vz, pad).
*/
class ParticleStore {
public:
    ParticleStore() : current_(0) {}

    void allocate(gpu::ResourceArena& arena, const ParticleLayout& layout);

    // Flat arrays, 4 floats per particle. Throws std::invalid_argument when
    // the arrays do not match the layout.
    void upload(gpu::ResourceArena& arena,
                const std::vector<float>& position_mass,
                const std::vector<float>& velocity_pad);

    void release(gpu::ResourceArena& arena);

    void swap() { current_ ^= 1; }

    const ParticleLayout& layout() const { return layout_; }
    size_t count() const { return layout_.count; }

    gpu::TextureId position() const { return positions_[current_]; }
    gpu::TextureId velocity() const { return velocities_[current_]; }
    gpu::TextureId target_position() const { return positions_[current_ ^ 1]; }
    gpu::TextureId target_velocity() const { return velocities_[current_ ^ 1]; }

private:
    ParticleLayout layout_;
    std::array<gpu::TextureId, 2> positions_{};
    std::array<gpu::TextureId, 2> velocities_{};
    int current_;
};
