#include "ParticleStore.h"
#include <cmath>
#include <stdexcept>
#include <string>

ParticleLayout ParticleLayout::for_count(size_t count, int width, int height) {
    if (count == 0) {
        throw std::invalid_argument("particle count must be positive");
    }
    ParticleLayout layout;
    layout.count = count;
    if (width <= 0) {
        width = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(count))));
    }
    if (height <= 0) {
        height = static_cast<int>((count + static_cast<size_t>(width) - 1) / static_cast<size_t>(width));
    }
    if (static_cast<size_t>(width) * static_cast<size_t>(height) < count) {
        throw std::invalid_argument("particle texture " + std::to_string(width) + "x" +
                                    std::to_string(height) + " cannot hold " +
                                    std::to_string(count) + " particles");
    }
    layout.width = width;
    layout.height = height;
    return layout;
}

void ParticleStore::allocate(gpu::ResourceArena& arena, const ParticleLayout& layout) {
    layout_ = layout;
    current_ = 0;
    positions_[0]  = arena.create_texture(layout.width, layout.height, "particles.position.ping");
    positions_[1]  = arena.create_texture(layout.width, layout.height, "particles.position.pong");
    velocities_[0] = arena.create_texture(layout.width, layout.height, "particles.velocity.ping");
    velocities_[1] = arena.create_texture(layout.width, layout.height, "particles.velocity.pong");
}

void ParticleStore::upload(gpu::ResourceArena& arena,
                           const std::vector<float>& position_mass,
                           const std::vector<float>& velocity_pad) {
    const size_t expected = layout_.count * 4;
    if (position_mass.size() != expected || velocity_pad.size() != expected) {
        throw std::invalid_argument("particle arrays must hold 4 floats per particle (expected " +
                                    std::to_string(expected) + ", got " +
                                    std::to_string(position_mass.size()) + " and " +
                                    std::to_string(velocity_pad.size()) + ")");
    }

    gpu::Texture2D& pos = arena.texture(position());
    gpu::Texture2D& vel = arena.texture(velocity());
    pos.clear();
    vel.clear();
    for (size_t i = 0; i < layout_.count; ++i) {
        const Eigen::Vector2i t = layout_.texel_of(i);
        pos.at(t.x(), t.y()) = gpu::Texel(position_mass[4 * i], position_mass[4 * i + 1],
                                          position_mass[4 * i + 2], position_mass[4 * i + 3]);
        vel.at(t.x(), t.y()) = gpu::Texel(velocity_pad[4 * i], velocity_pad[4 * i + 1],
                                          velocity_pad[4 * i + 2], velocity_pad[4 * i + 3]);
    }
    // Targets start as copies so a padding texel never reads garbage
    arena.texture(target_position()).texels = pos.texels;
    arena.texture(target_velocity()).texels = vel.texels;
}

void ParticleStore::release(gpu::ResourceArena& arena) {
    for (gpu::TextureId& id : positions_) {
        arena.release(id);
        id = gpu::kNullTexture;
    }
    for (gpu::TextureId& id : velocities_) {
        arena.release(id);
        id = gpu::kNullTexture;
    }
}
