#include "PipelineResources.h"
#include <string>

void PipelineResources::allocate(gpu::ResourceArena& arena,
                                 const ParticleLayout& layout,
                                 const std::vector<LevelConfig>& level_configs) {
    particles.allocate(arena, layout);
    levels = level_configs;
    level_textures.clear();
    level_textures.reserve(levels.size());
    for (size_t k = 0; k < levels.size(); ++k) {
        const LevelConfig& cfg = levels[k];
        const std::string prefix = "octree.L" + std::to_string(k);
        LevelTextures tex;
        tex.a0 = arena.create_texture(cfg.texture_width, cfg.texture_height, prefix + ".a0");
        tex.a1 = arena.create_texture(cfg.texture_width, cfg.texture_height, prefix + ".a1");
        tex.a2 = arena.create_texture(cfg.texture_width, cfg.texture_height, prefix + ".a2");
        level_textures.push_back(tex);
    }
    force = arena.create_texture(layout.width, layout.height, "force");
}

void PipelineResources::release(gpu::ResourceArena& arena) {
    particles.release(arena);
    for (LevelTextures& tex : level_textures) {
        arena.release(tex.a0);
        arena.release(tex.a1);
        arena.release(tex.a2);
    }
    level_textures.clear();
    arena.release(force);
    force = gpu::kNullTexture;
}
