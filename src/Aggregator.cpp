#include "Aggregator.h"
#include "Multipole.h"
#include <algorithm>
#include <cmath>

const gpu::KernelSignature& Aggregator::signature() {
    static const gpu::KernelSignature sig{"aggregate_l0", 1, 3, true};
    return sig;
}

Aggregator::Aggregator(gpu::Device& device) : device_(device), last_deposited_(0) {
    device_.link(signature());
}

Eigen::Vector3i Aggregator::voxel_for_position(const Eigen::Vector3f& pos,
                                               const geom::AABB3f& bounds,
                                               int grid_size) {
    const Eigen::Vector3f n = bounds.normalize(pos).cwiseMax(0.0f).cwiseMin(0.9999f);
    Eigen::Vector3i voxel;
    for (int a = 0; a < 3; ++a) {
        const int v = static_cast<int>(std::floor(n[a] * static_cast<float>(grid_size)));
        voxel[a] = std::clamp(v, 0, grid_size - 1);
    }
    return voxel;
}

void Aggregator::run(PipelineResources& resources, const geom::AABB3f& bounds) {
    const LevelConfig& level = resources.levels.front();
    const LevelTextures& targets = resources.level_textures.front();
    const gpu::Framebuffer fb({targets.a0, targets.a1, targets.a2}, gpu::BlendMode::Additive);

    device_.clear(fb);

    const ParticleLayout& layout = resources.particles.layout();
    const gpu::Texture2D& positions = device_.arena().texture(resources.particles.position());

    device_.draw_points(fb, layout.count, [&](size_t i, gpu::PointFragment& frag) {
        const Eigen::Vector2i src = layout.texel_of(i);
        const gpu::Texel& pm = positions.fetch(src.x(), src.y());
        if (!contributes(pm)) return false;

        const Eigen::Vector3f p = pm.head<3>();
        const Eigen::Vector2i dst = level.voxel_to_texel(voxel_for_position(p, bounds, level.grid_size));
        frag.x = dst.x();
        frag.y = dst.y();
        multipole::point_moments(p, pm.w(), frag.values[0], frag.values[1], frag.values[2]);
        return true;
    });

    size_t deposited = 0;
    for (size_t i = 0; i < layout.count; ++i) {
        const Eigen::Vector2i src = layout.texel_of(i);
        if (contributes(positions.fetch(src.x(), src.y()))) ++deposited;
    }
    last_deposited_ = deposited;
}
