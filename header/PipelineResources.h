#pragma once
#include "GpuDevice.h"
#include "OctreeLayout.h"
#include "ParticleStore.h"
#include <vector>

struct LevelTextures {
    gpu::TextureId a0 = gpu::kNullTexture;   // (Σmx, Σmy, Σmz, Σm)
    gpu::TextureId a1 = gpu::kNullTexture;   // (Σmx², Σmy², Σmz², Σmxy)
    gpu::TextureId a2 = gpu::kNullTexture;   // (Σmxz, Σmyz, 0, 0)
};

// Every handle the pipeline touches. Stages receive this explicitly; nothing
// is looked up through ambient device state.
struct PipelineResources {
    ParticleStore particles;
    std::vector<LevelConfig> levels;
    std::vector<LevelTextures> level_textures;
    gpu::TextureId force = gpu::kNullTexture;

    void allocate(gpu::ResourceArena& arena,
                  const ParticleLayout& layout,
                  const std::vector<LevelConfig>& level_configs);
    void release(gpu::ResourceArena& arena);

    bool allocated() const { return force != gpu::kNullTexture; }
    size_t num_levels() const { return levels.size(); }

    // Read textures a traversal pass binds: positions plus three per level
    int traversal_bindings() const { return 1 + 3 * static_cast<int>(levels.size()); }
};
