// tests/GPTestHooks.h
#pragma once
#ifndef GP_TESTING
#define GP_TESTING
#endif

#include "QuadrupoleGravity.h"
#include <cstdint>
#include <utility>
#include <vector>

struct GPTestHooks {
    struct LevelSnapshot {
        LevelConfig cfg;
        gpu::TexelBuffer a0, a1, a2;
    };

    struct Snapshot {
        std::vector<LevelSnapshot> levels;
        geom::AABB3f bounds;
        ParticleLayout layout;
        size_t N;
    };

    static Snapshot snapshot(const QuadrupoleGravity& s) {
        Snapshot out;
        const gpu::ResourceArena& arena = s.device_.arena();
        for (size_t k = 0; k < s.resources_.levels.size(); ++k) {
            const LevelTextures& tex = s.resources_.level_textures[k];
            LevelSnapshot lv;
            lv.cfg = s.resources_.levels[k];
            lv.a0 = arena.texture(tex.a0).texels;
            lv.a1 = arena.texture(tex.a1).texels;
            lv.a2 = arena.texture(tex.a2).texels;
            out.levels.push_back(std::move(lv));
        }
        out.bounds = s.bounds_->bounds();
        out.layout = s.resources_.particles.layout();
        out.N = s.particle_count_;
        return out;
    }

    static const gpu::Texel& voxel(const LevelSnapshot& lv, const gpu::TexelBuffer& buf,
                                   const Eigen::Vector3i& v) {
        const Eigen::Vector2i t = lv.cfg.voxel_to_texel(v);
        return buf[static_cast<size_t>(t.y()) * lv.cfg.texture_width + t.x()];
    }

    // Force the traversal would produce for a probe point under the current pyramid
    static Eigen::Vector3f probe(const QuadrupoleGravity& s, const Eigen::Vector3f& pos) {
        TraversalKernel::Counters counters;
        return s.traversal_->evaluate(s.resources_, s.bounds_->bounds(),
                                      s.traversal_params(), pos, 0.0f, counters);
    }

    // Replaces how a background bounds refresh is started
    static void set_refresh_launcher(BoundsTracker& tracker, BoundsTracker::Launcher launch) {
        tracker.launch_ = std::move(launch);
    }

    static uint64_t passes_issued(const QuadrupoleGravity& s) { return s.device_.passes_issued(); }
};
