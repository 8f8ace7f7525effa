#include "PyramidReducer.h"
#include <stdexcept>
#include <string>

const gpu::KernelSignature& PyramidReducer::signature() {
    static const gpu::KernelSignature sig{"reduce_level", 3, 3, false};
    return sig;
}

PyramidReducer::PyramidReducer(gpu::Device& device) : device_(device) {
    device_.link(signature());
}

void PyramidReducer::run(PipelineResources& resources) {
    for (size_t k = 1; k < resources.levels.size(); ++k) {
        reduce_level(resources, k);
    }
}

void PyramidReducer::reduce_level(PipelineResources& resources, size_t k) {
    if (k == 0 || k >= resources.levels.size()) {
        throw std::out_of_range("reduce_level: level " + std::to_string(k) + " has no parent pass");
    }
    const LevelConfig& child_cfg = resources.levels[k - 1];
    const LevelConfig& parent_cfg = resources.levels[k];
    const LevelTextures& child_tex = resources.level_textures[k - 1];
    const LevelTextures& parent_tex = resources.level_textures[k];

    const gpu::Texture2D& c0 = device_.arena().texture(child_tex.a0);
    const gpu::Texture2D& c1 = device_.arena().texture(child_tex.a1);
    const gpu::Texture2D& c2 = device_.arena().texture(child_tex.a2);

    const gpu::Framebuffer fb({parent_tex.a0, parent_tex.a1, parent_tex.a2}, gpu::BlendMode::Replace);
    device_.draw_fullscreen(fb, [&](int tx, int ty, gpu::Texel* out) {
        Eigen::Vector3i parent;
        if (!parent_cfg.texel_to_voxel(tx, ty, parent)) return;   // unused tile stays zero

        const Eigen::Vector3i base = 2 * parent;
        for (int dz = 0; dz < 2; ++dz) {
            for (int dy = 0; dy < 2; ++dy) {
                for (int dx = 0; dx < 2; ++dx) {
                    const Eigen::Vector3i child = base + Eigen::Vector3i(dx, dy, dz);
                    if (!child_cfg.contains(child)) continue;
                    const Eigen::Vector2i t = child_cfg.voxel_to_texel(child);
                    out[0] += c0.fetch(t.x(), t.y());
                    out[1] += c1.fetch(t.x(), t.y());
                    out[2] += c2.fetch(t.x(), t.y());
                }
            }
        }
    });
}
